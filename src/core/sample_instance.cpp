#include "jikanwari_csp/sample_instance.hpp"

namespace jikanwari_csp {

ReferenceData sample_reference_data() {
    ReferenceData ref;

    // 時限
    const std::vector<std::string> days = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday"};
    const std::vector<std::pair<std::string, std::string>> periods = {
        {"9:00", "10:30"}, {"10:45", "12:15"}, {"12:30", "14:00"}, {"14:15", "15:45"}
    };
    int next_ts = 0;
    for (const auto& day : days) {
        for (size_t p = 0; p < periods.size(); ++p) {
            ref.add_timeslot({"TS" + std::to_string(next_ts++), day, static_cast<int>(p),
                              periods[p].first, periods[p].second});
        }
    }

    // 教室
    for (int i = 1; i <= 6; ++i) {
        ref.add_room({"R10" + std::to_string(i), RoomKind::Lecture, 60});
    }
    for (int i = 1; i <= 4; ++i) {
        ref.add_room({"L" + std::to_string(i), RoomKind::Lab, 30});
    }

    // 科目
    ref.add_course({"AID312", "Intelligent Systems", 3, CourseKind::LectureAndLab});
    ref.add_course({"PHY113", "Physics", 3, CourseKind::LectureAndLab});
    ref.add_course({"LRA101", "Technical Writing", 2, CourseKind::Lecture});
    ref.add_course({"MTH111", "Calculus", 4, CourseKind::Lecture});
    ref.add_course({"CSC111", "Programming", 5, CourseKind::LectureAndLab});
    ref.add_course({"ECE223", "Digital Logic", 3, CourseKind::Lecture});
    ref.add_course({"HUM101", "Ethics", 1, CourseKind::Lecture});

    // 教員
    ref.add_instructor({"PROF01", "Dr. Reda", "Professor", {"AID312", "ECE223"}, "Tuesday"});
    ref.add_instructor({"PROF02", "Dr. Salem", "Professor", {"PHY113"}, std::nullopt});
    ref.add_instructor({"PROF03", "Dr. Nour", "Assistant Professor", {"PHY113", "MTH111"}, "Sunday"});
    ref.add_instructor({"PROF04", "Ms. Hana", "Lecturer", {"LRA101", "HUM101"}, std::nullopt});
    ref.add_instructor({"PROF05", "Dr. Karim", "Professor", {"MTH111", "CSC111"}, "Thursday"});
    ref.add_instructor({"PROF06", "Dr. Laila", "Assistant Professor", {"CSC111", "ECE223", "AID312"}, std::nullopt});

    // クラス
    ref.add_section({"S1_L1", 40, {"AID312", "PHY113", "LRA101", "MTH111"}});
    ref.add_section({"S2_L1", 38, {"AID312", "PHY113", "LRA101", "MTH111"}});
    ref.add_section({"S3_L1", 42, {"CSC111", "MTH111", "ECE223", "HUM101"}});
    ref.add_section({"S4_L1", 35, {"CSC111", "PHY113", "ECE223", "LRA101"}});

    return ref;
}

std::vector<std::string> sample_section_ids() {
    return {"S1_L1", "S2_L1", "S3_L1", "S4_L1"};
}

} // namespace jikanwari_csp
