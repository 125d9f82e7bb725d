#include <catch2/catch.hpp>
#include "jikanwari_csp/domain.hpp"
#include "jikanwari_csp/entities.hpp"
#include "jikanwari_csp/model.hpp"
#include "jikanwari_csp/model_builder.hpp"
#include "jikanwari_csp/sample_instance.hpp"
#include "jikanwari_csp/solver.hpp"
#include <cstdint>
#include <stdexcept>

using namespace jikanwari_csp;

// Small reference set:
//   Sunday TS0, TS1 / Monday TS2
//   lecture rooms R101, R102 / lab L1
//   PROF01 (MTH111, not on Monday), PROF02 (MTH111, PHY113)
//   ART100 has no qualified instructor
static ReferenceData make_reference() {
    ReferenceData ref;
    ref.add_timeslot({"TS0", "Sunday", 0, "9:00", "10:30"});
    ref.add_timeslot({"TS1", "Sunday", 1, "10:45", "12:15"});
    ref.add_timeslot({"TS2", "Monday", 0, "9:00", "10:30"});

    ref.add_room({"R101", RoomKind::Lecture, 60});
    ref.add_room({"R102", RoomKind::Lecture, 60});
    ref.add_room({"L1", RoomKind::Lab, 30});

    ref.add_course({"MTH111", "Calculus", 3, CourseKind::Lecture});
    ref.add_course({"PHY113", "Physics", 1, CourseKind::LectureAndLab});
    ref.add_course({"ART100", "Art", 2, CourseKind::Lecture});

    ref.add_instructor({"PROF01", "Dr. A", "Professor", {"MTH111"}, "Monday"});
    ref.add_instructor({"PROF02", "Dr. B", "Lecturer", {"MTH111", "PHY113"}, std::nullopt});

    ref.add_section({"S1", 30, {"MTH111", "PHY113"}});
    ref.add_section({"S2", 25, {"MTH111", "XYZ999", "ART100"}});
    return ref;
}

// ============================================================================
// Entity predicates
// ============================================================================

TEST_CASE("Course needs_lab", "[entities]") {
    Course lecture{"MTH111", "Calculus", 3, CourseKind::Lecture};
    Course lab{"PHY113", "Physics", 3, CourseKind::LectureAndLab};

    REQUIRE(!lecture.needs_lab());
    REQUIRE(lecture.required_room_kind() == RoomKind::Lecture);
    REQUIRE(lab.needs_lab());
    REQUIRE(lab.required_room_kind() == RoomKind::Lab);
}

TEST_CASE("Instructor qualification and availability", "[entities]") {
    Instructor reda{"PROF01", "Dr. Reda", "Professor", {"AID312", "ECE223"}, "Tuesday"};

    SECTION("can_teach") {
        REQUIRE(reda.can_teach("AID312"));
        REQUIRE(reda.can_teach("ECE223"));
        REQUIRE(!reda.can_teach("PHY113"));
    }

    SECTION("is_available_on") {
        REQUIRE(reda.is_available_on("Monday"));
        REQUIRE(!reda.is_available_on("Tuesday"));
    }

    SECTION("no unavailable day") {
        Instructor free{"PROF02", "Dr. B", "Lecturer", {}, std::nullopt};
        REQUIRE(free.is_available_on("Tuesday"));
        REQUIRE(!free.can_teach("AID312"));
    }
}

// ============================================================================
// ReferenceData
// ============================================================================

TEST_CASE("ReferenceData lookup", "[entities][reference]") {
    auto ref = make_reference();

    REQUIRE(ref.find_course("MTH111") != nullptr);
    REQUIRE(ref.find_course("MTH111")->credits == 3);
    REQUIRE(ref.find_course("XYZ999") == nullptr);
    REQUIRE(ref.find_room("L1")->kind == RoomKind::Lab);
    REQUIRE(ref.find_timeslot("TS2")->weekday == "Monday");
    REQUIRE(ref.find_instructor("PROF03") == nullptr);
    REQUIRE(ref.find_section("S2")->courses.size() == 3);
}

TEST_CASE("ReferenceData rejects duplicate ids", "[entities][reference]") {
    auto ref = make_reference();

    REQUIRE_THROWS_AS(ref.add_course({"MTH111", "Again", 3, CourseKind::Lecture}), std::invalid_argument);
    REQUIRE_THROWS_AS(ref.add_room({"R101", RoomKind::Lab, 10}), std::invalid_argument);
    REQUIRE_THROWS_AS(ref.add_timeslot({"TS0", "Friday", 0, "", ""}), std::invalid_argument);
    REQUIRE(ref.courses().size() == 3);
}

TEST_CASE("ReferenceData derived queries", "[entities][reference]") {
    auto ref = make_reference();

    SECTION("rooms_of_kind keeps table order") {
        auto rooms = ref.rooms_of_kind(RoomKind::Lecture);
        REQUIRE(rooms.size() == 2);
        REQUIRE(rooms[0]->id == "R101");
        REQUIRE(rooms[1]->id == "R102");
    }

    SECTION("qualified_instructors") {
        REQUIRE(ref.qualified_instructors("MTH111").size() == 2);
        REQUIRE(ref.qualified_instructors("PHY113").size() == 1);
        REQUIRE(ref.qualified_instructors("ART100").empty());
    }

    SECTION("timeslots_on orders by position") {
        ReferenceData r;
        r.add_timeslot({"B", "Sunday", 2, "", ""});
        r.add_timeslot({"A", "Sunday", 0, "", ""});
        r.add_timeslot({"C", "Monday", 0, "", ""});
        r.add_timeslot({"D", "Sunday", 1, "", ""});

        auto sunday = r.timeslots_on("Sunday");
        REQUIRE(sunday == std::vector<std::string>{"A", "D", "B"});
        REQUIRE(r.weekdays() == std::vector<std::string>{"Sunday", "Monday"});
    }
}

// ============================================================================
// Lecture identity
// ============================================================================

TEST_CASE("LectureId key and ordering", "[lecture]") {
    LectureId a{"S1_L1", "AID312", 1};
    LectureId b{"S1_L1", "AID312", 2};

    REQUIRE(a.key() == "S1_L1_AID312_L1");
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(LectureIdHash{}(a) == LectureIdHash{}(LectureId{"S1_L1", "AID312", 1}));
}

// ============================================================================
// Domain generator
// ============================================================================

TEST_CASE("lectures_per_week table", "[builder]") {
    REQUIRE(lectures_per_week(1) == 1);
    REQUIRE(lectures_per_week(2) == 1);
    REQUIRE(lectures_per_week(3) == 2);
    REQUIRE(lectures_per_week(4) == 2);
    REQUIRE(lectures_per_week(5) == 3);
    REQUIRE(lectures_per_week(0) == 2);
    REQUIRE(lectures_per_week(6) == 2);
}

TEST_CASE("ModelBuilder creates lectures per section", "[builder]") {
    auto ref = make_reference();
    ModelBuilder builder(ref);
    auto model = builder.build({"S1"});

    REQUIRE(model.size() == 3);
    REQUIRE(model.lectures()[0] == LectureId{"S1", "MTH111", 1});
    REQUIRE(model.lectures()[1] == LectureId{"S1", "MTH111", 2});
    REQUIRE(model.lectures()[2] == LectureId{"S1", "PHY113", 1});
    REQUIRE(model.diagnostics().empty());
    REQUIRE(model.empty_domains().empty());
}

TEST_CASE("ModelBuilder domain ordering", "[builder]") {
    auto ref = make_reference();
    ModelBuilder builder(ref);

    // timeslot -> room -> instructor; PROF01 is skipped on Monday
    auto domain = builder.build_domain(*ref.find_course("MTH111"));
    REQUIRE(domain.size() == 10);
    REQUIRE(domain[0] == AssignmentValue{"TS0", "R101", "PROF01"});
    REQUIRE(domain[1] == AssignmentValue{"TS0", "R101", "PROF02"});
    REQUIRE(domain[2] == AssignmentValue{"TS0", "R102", "PROF01"});
    REQUIRE(domain[8] == AssignmentValue{"TS2", "R101", "PROF02"});
    REQUIRE(domain[9] == AssignmentValue{"TS2", "R102", "PROF02"});

    auto lab = builder.build_domain(*ref.find_course("PHY113"));
    REQUIRE(lab.size() == 3);
    for (const auto& v : lab) {
        REQUIRE(v.room_id == "L1");
        REQUIRE(v.instructor_id == "PROF02");
    }
}

TEST_CASE("ModelBuilder recoverable problems", "[builder]") {
    auto ref = make_reference();
    ModelBuilder builder(ref);
    auto model = builder.build({"S2", "S9"});

    SECTION("missing course is skipped") {
        for (const auto& id : model.lectures()) {
            REQUIRE(id.course_id != "XYZ999");
        }
    }

    SECTION("course without instructor gets an empty domain") {
        const Domain* art = model.find_domain(LectureId{"S2", "ART100", 1});
        REQUIRE(art != nullptr);
        REQUIRE(art->empty());
        REQUIRE(model.empty_domains().size() == 1);
    }

    SECTION("diagnostics are recorded") {
        // XYZ999 missing, ART100 without instructor, S9 unknown
        REQUIRE(model.diagnostics().size() == 3);
    }

    REQUIRE(model.size() == 3);
}

TEST_CASE("ModelBuilder lab course without a lab room", "[builder]") {
    ReferenceData ref;
    ref.add_timeslot({"TS0", "Sunday", 0, "9:00", "10:30"});
    ref.add_timeslot({"TS1", "Sunday", 1, "10:45", "12:15"});
    ref.add_room({"R101", RoomKind::Lecture, 60});
    ref.add_course({"PHY113", "Physics", 3, CourseKind::LectureAndLab});
    ref.add_instructor({"PROF02", "Dr. B", "Lecturer", {"PHY113"}, std::nullopt});
    ref.add_section({"S1", 30, {"PHY113"}});

    ModelBuilder builder(ref);
    auto model = builder.build({"S1"});

    // lectures are still created, with empty domains
    REQUIRE(model.size() == 2);
    REQUIRE(model.empty_domains().size() == 2);
    REQUIRE(model.diagnostics().size() == 1);
    REQUIRE(model.diagnostics()[0] == "No feasible (timeslot, room, instructor) for PHY113");

    Solver solver;
    auto result = solver.solve(model);
    REQUIRE(result.status == SolveStatus::Exhausted);
    REQUIRE(result.stats.iterations == 0);
}

TEST_CASE("ModelBuilder instructor unavailable on every timeslot", "[builder]") {
    ReferenceData ref;
    ref.add_timeslot({"TS0", "Monday", 0, "9:00", "10:30"});
    ref.add_timeslot({"TS1", "Monday", 1, "10:45", "12:15"});
    ref.add_room({"R101", RoomKind::Lecture, 60});
    ref.add_course({"MTH111", "Calculus", 1, CourseKind::Lecture});
    ref.add_instructor({"PROF01", "Dr. A", "Professor", {"MTH111"}, "Monday"});
    ref.add_section({"S1", 30, {"MTH111"}});

    ModelBuilder builder(ref);
    auto model = builder.build({"S1"});

    REQUIRE(model.size() == 1);
    REQUIRE(model.domain(0).empty());
    REQUIRE(model.diagnostics().size() == 1);
    REQUIRE(model.diagnostics()[0] == "No feasible (timeslot, room, instructor) for MTH111");

    Solver solver;
    auto result = solver.solve(model);
    REQUIRE(result.status == SolveStatus::Exhausted);
    REQUIRE(result.stats.iterations == 0);
}

TEST_CASE("ModelBuilder ignores a course listed twice", "[builder]") {
    auto ref = make_reference();
    ref.add_section({"S3", 20, {"PHY113", "PHY113"}});
    ModelBuilder builder(ref);
    auto model = builder.build({"S3"});

    REQUIRE(model.size() == 1);
    REQUIRE(model.diagnostics().size() == 1);
}

TEST_CASE("Generated domains satisfy the unary rules", "[builder][sample]") {
    auto ref = sample_reference_data();
    ModelBuilder builder(ref);
    auto model = builder.build(sample_section_ids());

    REQUIRE(model.size() > 0);
    REQUIRE(model.diagnostics().empty());

    for (size_t i = 0; i < model.size(); ++i) {
        const auto& id = model.lectures()[i];
        const Course* course = ref.find_course(id.course_id);
        REQUIRE(course != nullptr);
        REQUIRE(!model.domain(i).empty());

        for (const auto& value : model.domain(i)) {
            const Room* room = ref.find_room(value.room_id);
            const Instructor* instructor = ref.find_instructor(value.instructor_id);
            const TimeSlot* ts = ref.find_timeslot(value.timeslot_id);
            REQUIRE(room != nullptr);
            REQUIRE(instructor != nullptr);
            REQUIRE(ts != nullptr);

            REQUIRE(room->kind == course->required_room_kind());
            REQUIRE(instructor->can_teach(id.course_id));
            REQUIRE(instructor->is_available_on(ts->weekday));
        }
    }
}

// ============================================================================
// Model
// ============================================================================

TEST_CASE("Model add_lecture and lookup", "[model]") {
    Model model;
    Domain d({AssignmentValue{"TS0", "R101", "PROF01"}});
    size_t idx = model.add_lecture(LectureId{"S1", "MTH111", 1}, d);

    REQUIRE(idx == 0);
    REQUIRE(model.index_of(LectureId{"S1", "MTH111", 1}) == 0);
    REQUIRE(model.index_of(LectureId{"S1", "MTH111", 2}) == SIZE_MAX);
    REQUIRE(model.domain(0).contains(AssignmentValue{"TS0", "R101", "PROF01"}));
    REQUIRE(!model.domain(0).contains(AssignmentValue{"TS0", "R101", "PROF02"}));
    REQUIRE_THROWS_AS(model.add_lecture(LectureId{"S1", "MTH111", 1}, d), std::invalid_argument);
}

TEST_CASE("Model summary", "[model]") {
    auto ref = make_reference();
    ModelBuilder builder(ref);
    auto model = builder.build({"S1", "S2"});
    auto s = model.summary();

    // S1: MTH111 x2 (10), PHY113 x1 (3) / S2: MTH111 x2 (10), ART100 x1 (0)
    REQUIRE(s.variable_count == 6);
    REQUIRE(s.min_domain_size == 0);
    REQUIRE(s.max_domain_size == 10);
    REQUIRE(s.lectures_per_section.at("S1") == 3);
    REQUIRE(s.lectures_per_section.at("S2") == 3);
}
