#include "jikanwari_csp/entities.hpp"
#include <algorithm>
#include <stdexcept>

namespace jikanwari_csp {

namespace {

template <typename T>
void insert_unique(std::vector<T>& records, std::map<std::string, size_t>& index,
                   T record, const char* table) {
    if (index.count(record.id)) {
        throw std::invalid_argument(std::string("Duplicate ") + table + " id: " + record.id);
    }
    index.emplace(record.id, records.size());
    records.push_back(std::move(record));
}

template <typename T>
const T* lookup(const std::vector<T>& records, const std::map<std::string, size_t>& index,
                const std::string& id) {
    auto it = index.find(id);
    if (it == index.end()) {
        return nullptr;
    }
    return &records[it->second];
}

}  // namespace

bool Instructor::can_teach(const std::string& course_id) const {
    return std::find(qualified_courses.begin(), qualified_courses.end(), course_id)
        != qualified_courses.end();
}

bool Instructor::is_available_on(const std::string& weekday) const {
    if (!unavailable_day) {
        return true;
    }
    return *unavailable_day != weekday;
}

void ReferenceData::add_course(Course course) {
    insert_unique(courses_, course_index_, std::move(course), "course");
}

void ReferenceData::add_instructor(Instructor instructor) {
    insert_unique(instructors_, instructor_index_, std::move(instructor), "instructor");
}

void ReferenceData::add_room(Room room) {
    insert_unique(rooms_, room_index_, std::move(room), "room");
}

void ReferenceData::add_timeslot(TimeSlot timeslot) {
    insert_unique(timeslots_, timeslot_index_, std::move(timeslot), "timeslot");
}

void ReferenceData::add_section(Section section) {
    insert_unique(sections_, section_index_, std::move(section), "section");
}

const Course* ReferenceData::find_course(const std::string& id) const {
    return lookup(courses_, course_index_, id);
}

const Instructor* ReferenceData::find_instructor(const std::string& id) const {
    return lookup(instructors_, instructor_index_, id);
}

const Room* ReferenceData::find_room(const std::string& id) const {
    return lookup(rooms_, room_index_, id);
}

const TimeSlot* ReferenceData::find_timeslot(const std::string& id) const {
    return lookup(timeslots_, timeslot_index_, id);
}

const Section* ReferenceData::find_section(const std::string& id) const {
    return lookup(sections_, section_index_, id);
}

std::vector<const Room*> ReferenceData::rooms_of_kind(RoomKind kind) const {
    std::vector<const Room*> result;
    for (const auto& room : rooms_) {
        if (room.kind == kind) {
            result.push_back(&room);
        }
    }
    return result;
}

std::vector<const Instructor*> ReferenceData::qualified_instructors(const std::string& course_id) const {
    std::vector<const Instructor*> result;
    for (const auto& instructor : instructors_) {
        if (instructor.can_teach(course_id)) {
            result.push_back(&instructor);
        }
    }
    return result;
}

std::vector<std::string> ReferenceData::timeslots_on(const std::string& weekday) const {
    std::vector<const TimeSlot*> slots;
    for (const auto& ts : timeslots_) {
        if (ts.weekday == weekday) {
            slots.push_back(&ts);
        }
    }
    // 同じ position の場合は登録順を保つ
    std::stable_sort(slots.begin(), slots.end(), [](const TimeSlot* a, const TimeSlot* b) {
        return a->position < b->position;
    });

    std::vector<std::string> ids;
    ids.reserve(slots.size());
    for (const auto* ts : slots) {
        ids.push_back(ts->id);
    }
    return ids;
}

std::vector<std::string> ReferenceData::weekdays() const {
    std::vector<std::string> days;
    for (const auto& ts : timeslots_) {
        if (std::find(days.begin(), days.end(), ts.weekday) == days.end()) {
            days.push_back(ts.weekday);
        }
    }
    return days;
}

} // namespace jikanwari_csp
