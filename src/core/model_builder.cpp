#include "jikanwari_csp/model_builder.hpp"
#include <iostream>

namespace jikanwari_csp {

int lectures_per_week(int credits) {
    switch (credits) {
        case 1: return 1;
        case 2: return 1;
        case 3: return 2;
        case 4: return 2;
        case 5: return 3;
        default: return 2;
    }
}

ModelBuilder::ModelBuilder(const ReferenceData& reference)
    : reference_(reference) {}

Model ModelBuilder::build(const std::vector<std::string>& section_ids) const {
    Model model;

    for (const auto& section_id : section_ids) {
        const Section* section = reference_.find_section(section_id);
        if (!section) {
            warn(model, "Section " + section_id + " not found");
            continue;
        }

        for (const auto& course_id : section->courses) {
            const Course* course = reference_.find_course(course_id);
            if (!course) {
                warn(model, "Course " + course_id + " not found (section " + section_id + ")");
                continue;
            }

            // 同じ科目を二重に履修している場合は1回分だけ作る
            if (model.contains(LectureId{section_id, course_id, 1})) {
                warn(model, "Course " + course_id + " listed twice in section " + section_id);
                continue;
            }

            Domain domain = build_domain(*course);
            if (domain.empty()) {
                if (reference_.qualified_instructors(course_id).empty()) {
                    warn(model, "No qualified instructor for " + course_id);
                } else {
                    warn(model, "No feasible (timeslot, room, instructor) for " + course_id);
                }
            }

            int n = lectures_per_week(course->credits);
            for (int lec = 1; lec <= n; ++lec) {
                model.add_lecture(LectureId{section_id, course_id, lec}, domain);
            }
        }
    }

    if (verbose_) {
        auto s = model.summary();
        std::cerr << "% [verbose] model built: " << s.variable_count << " lectures, domain size "
                  << s.min_domain_size << ".." << s.max_domain_size
                  << " (avg " << s.average_domain_size << ")\n";
    }
    return model;
}

Domain ModelBuilder::build_domain(const Course& course) const {
    Domain domain;

    auto rooms = reference_.rooms_of_kind(course.required_room_kind());
    auto instructors = reference_.qualified_instructors(course.id);
    if (rooms.empty() || instructors.empty()) {
        return domain;
    }

    for (const auto& ts : reference_.timeslots()) {
        for (const auto* room : rooms) {
            for (const auto* instructor : instructors) {
                if (!instructor->is_available_on(ts.weekday)) {
                    continue;
                }
                domain.push_back(AssignmentValue{ts.id, room->id, instructor->id});
            }
        }
    }
    return domain;
}

void ModelBuilder::warn(Model& model, std::string message) const {
    if (verbose_) {
        std::cerr << "% [warning] " << message << "\n";
    }
    model.add_diagnostic(std::move(message));
}

} // namespace jikanwari_csp
