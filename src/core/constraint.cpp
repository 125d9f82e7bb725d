#include "jikanwari_csp/constraint.hpp"

namespace jikanwari_csp {

namespace {

constexpr std::array<ConflictKind, 3> kAllKinds = {
    ConflictKind::Instructor, ConflictKind::Room, ConflictKind::Section
};

}  // namespace

const char* to_string(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::Instructor: return "instructor";
        case ConflictKind::Room: return "room";
        case ConflictKind::Section: return "section";
    }
    return "unknown";
}

std::string Conflict::describe() const {
    std::string msg = to_string(kind);
    msg += " " + resource_id + " has conflict at " + timeslot_id + ": [";
    for (size_t i = 0; i < lectures.size(); ++i) {
        if (i > 0) msg += ", ";
        msg += lectures[i].key();
    }
    msg += "]";
    return msg;
}

// ============================================================================
// Assignment
// ============================================================================

const std::string& Assignment::resource_of(ConflictKind kind, const LectureId& id,
                                           const AssignmentValue& value) {
    switch (kind) {
        case ConflictKind::Instructor: return value.instructor_id;
        case ConflictKind::Room: return value.room_id;
        case ConflictKind::Section: break;
    }
    return id.section_id;
}

void Assignment::occupy(const LectureId& id, const AssignmentValue& value) {
    for (auto kind : kAllKinds) {
        auto& table = occupancy_[static_cast<size_t>(kind)];
        size_t& count = table[SlotKey{resource_of(kind, id, value), value.timeslot_id}];
        ++count;
        if (count == 2) {
            ++violations_;
        }
    }
}

void Assignment::release(const LectureId& id, const AssignmentValue& value) {
    for (auto kind : kAllKinds) {
        auto& table = occupancy_[static_cast<size_t>(kind)];
        auto it = table.find(SlotKey{resource_of(kind, id, value), value.timeslot_id});
        if (it == table.end()) {
            continue;
        }
        if (it->second == 2) {
            --violations_;
        }
        if (--it->second == 0) {
            table.erase(it);
        }
    }
}

void Assignment::assign(const LectureId& id, const AssignmentValue& value) {
    auto it = values_.find(id);
    if (it != values_.end()) {
        release(id, it->second);
        it->second = value;
    } else {
        values_.emplace(id, value);
    }
    occupy(id, value);
}

bool Assignment::unassign(const LectureId& id) {
    auto it = values_.find(id);
    if (it == values_.end()) {
        return false;
    }
    release(id, it->second);
    values_.erase(it);
    return true;
}

void Assignment::clear() {
    values_.clear();
    for (auto& table : occupancy_) {
        table.clear();
    }
    violations_ = 0;
}

const AssignmentValue* Assignment::find(const LectureId& id) const {
    auto it = values_.find(id);
    return it == values_.end() ? nullptr : &it->second;
}

size_t Assignment::occupancy(ConflictKind kind, const std::string& resource_id,
                             const std::string& timeslot_id) const {
    const auto& table = occupancy_[static_cast<size_t>(kind)];
    auto it = table.find(SlotKey{resource_id, timeslot_id});
    return it == table.end() ? 0 : it->second;
}

// ============================================================================
// ハード制約
// ============================================================================

bool is_consistent(const LectureId& id, const AssignmentValue& value,
                   const Assignment& assignment) {
    const AssignmentValue* old = assignment.find(id);
    size_t violations = assignment.violation_count();

    for (auto kind : kAllKinds) {
        const std::string& new_res = Assignment::resource_of(kind, id, value);
        if (old) {
            const std::string& old_res = Assignment::resource_of(kind, id, *old);
            if (old_res == new_res && old->timeslot_id == value.timeslot_id) {
                continue;  // 同じ枠への上書きは占有数を変えない
            }
            // 上書きで旧枠が 2 → 1 になれば違反が1つ解消する
            if (assignment.occupancy(kind, old_res, old->timeslot_id) == 2) {
                --violations;
            }
        }
        if (assignment.occupancy(kind, new_res, value.timeslot_id) == 1) {
            ++violations;
        }
    }
    return violations == 0;
}

bool satisfies_hard_constraints(const Assignment& assignment) {
    return assignment.violation_count() == 0;
}

std::vector<Conflict> find_all_conflicts(const Assignment& assignment) {
    std::vector<Conflict> conflicts;

    for (auto kind : kAllKinds) {
        std::map<std::pair<std::string, std::string>, std::vector<LectureId>> schedule;
        for (const auto& [id, value] : assignment) {
            const std::string* resource = nullptr;
            switch (kind) {
                case ConflictKind::Instructor: resource = &value.instructor_id; break;
                case ConflictKind::Room: resource = &value.room_id; break;
                case ConflictKind::Section: resource = &id.section_id; break;
            }
            schedule[{*resource, value.timeslot_id}].push_back(id);
        }

        for (auto& [key, lectures] : schedule) {
            if (lectures.size() > 1) {
                conflicts.push_back(Conflict{kind, key.first, key.second, std::move(lectures)});
            }
        }
    }
    return conflicts;
}

} // namespace jikanwari_csp
