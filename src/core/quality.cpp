#include "jikanwari_csp/quality.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace jikanwari_csp {

namespace {

constexpr int kDifferentPrefixDistance = 3;
constexpr int kUnparsableDistance = 1;
constexpr long long kRoomsPerDistanceUnit = 5;
constexpr size_t kMaxRoomNumberDigits = 18;  // long long に収まる桁数

// "R101" -> ("R", "101")
std::pair<std::string, std::string> split_room_id(const std::string& id) {
    size_t i = 0;
    while (i < id.size() && !std::isdigit(static_cast<unsigned char>(id[i]))) {
        ++i;
    }
    return {id.substr(0, i), id.substr(i)};
}

bool parse_room_number(const std::string& digits, long long& number) {
    if (digits.empty() || digits.size() > kMaxRoomNumberDigits) {
        return false;
    }
    number = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        number = number * 10 + (c - '0');
    }
    return true;
}

}  // namespace

int room_distance(const std::string& room1, const std::string& room2) {
    if (room1 == room2) {
        return 0;
    }

    auto [prefix1, digits1] = split_room_id(room1);
    auto [prefix2, digits2] = split_room_id(room2);
    if (prefix1 != prefix2) {
        return kDifferentPrefixDistance;
    }

    long long n1 = 0;
    long long n2 = 0;
    if (!parse_room_number(digits1, n1) || !parse_room_number(digits2, n2)) {
        return kUnparsableDistance;
    }
    long long distance = std::llabs(n1 - n2) / kRoomsPerDistanceUnit;
    return static_cast<int>(std::min<long long>(distance, std::numeric_limits<int>::max()));
}

QualityScorer::QualityScorer(const ReferenceData& reference, QualityConfig config)
    : config_(std::move(config)) {
    for (const auto& day : reference.weekdays()) {
        auto slots = reference.timeslots_on(day);
        for (size_t i = 0; i < slots.size(); ++i) {
            places_[slots[i]] = SlotPlace{day, i};
        }
        day_slots_[day] = std::move(slots);
    }
}

const QualityScorer::SlotPlace& QualityScorer::place_of(const std::string& timeslot_id) const {
    auto it = places_.find(timeslot_id);
    if (it == places_.end()) {
        throw std::runtime_error("Unknown timeslot: " + timeslot_id);
    }
    return it->second;
}

QualityBreakdown QualityScorer::evaluate(const Assignment& assignment) const {
    QualityBreakdown b;
    b.base = BASE_SCORE;
    b.gap_penalty = gap_penalty(assignment);
    b.balance_bonus = balance_bonus(assignment);
    b.time_preference_penalty = time_preference_penalty(assignment);
    b.room_distance_penalty = room_distance_penalty(assignment);
    b.total = b.base - b.gap_penalty + b.balance_bonus
            - b.time_preference_penalty - b.room_distance_penalty;
    return b;
}

double QualityScorer::gap_penalty(const Assignment& assignment) const {
    // (section, weekday) -> 曜日内の順位
    std::map<std::pair<std::string, std::string>, std::vector<size_t>> schedules;
    for (const auto& [id, value] : assignment) {
        const auto& place = place_of(value.timeslot_id);
        schedules[{id.section_id, place.weekday}].push_back(place.index);
    }

    double penalty = 0.0;
    for (auto& [key, indices] : schedules) {
        if (indices.size() < 2) {
            continue;
        }
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        size_t span = indices.back() - indices.front() + 1;
        size_t gaps = span - indices.size();
        penalty += static_cast<double>(gaps) * config_.weights.gap;
    }
    return penalty;
}

double QualityScorer::balance_bonus(const Assignment& assignment) const {
    // section -> weekday -> コマ数
    std::map<std::string, std::map<std::string, size_t>> day_counts;
    for (const auto& [id, value] : assignment) {
        day_counts[id.section_id][place_of(value.timeslot_id).weekday]++;
    }

    double bonus = 0.0;
    for (auto& [section_id, counts] : day_counts) {
        if (config_.balance_over_all_weekdays) {
            for (const auto& [day, slots] : day_slots_) {
                counts.emplace(day, 0);
            }
        }

        double n = static_cast<double>(counts.size());
        double mean = 0.0;
        for (const auto& [day, c] : counts) {
            mean += static_cast<double>(c);
        }
        mean /= n;

        double variance = 0.0;
        for (const auto& [day, c] : counts) {
            double d = static_cast<double>(c) - mean;
            variance += d * d;
        }
        variance /= n;

        double std_dev = std::sqrt(variance);
        bonus += std::max(0.0, BALANCE_CEILING - std_dev) * config_.weights.balance;
    }
    return bonus;
}

double QualityScorer::time_preference_penalty(const Assignment& assignment) const {
    double penalty = 0.0;
    for (const auto& [id, value] : assignment) {
        if (config_.early_timeslots.count(value.timeslot_id)) {
            penalty += config_.weights.early;
        }
        if (config_.late_timeslots.count(value.timeslot_id)) {
            penalty += config_.weights.late;
        }
    }
    return penalty;
}

double QualityScorer::room_distance_penalty(const Assignment& assignment) const {
    std::map<std::pair<std::string, std::string>, DaySchedule> section_schedules;
    std::map<std::pair<std::string, std::string>, DaySchedule> instructor_schedules;
    std::map<std::string, std::string> occupant_rooms;  // timeslot -> LectureId 順で最後の講義コマの教室

    for (const auto& [id, value] : assignment) {
        const auto& place = place_of(value.timeslot_id);
        section_schedules[{id.section_id, place.weekday}].emplace_back(place.index, value.room_id);
        instructor_schedules[{value.instructor_id, place.weekday}].emplace_back(place.index, value.room_id);
        occupant_rooms[value.timeslot_id] = value.room_id;
    }

    double penalty = 0.0;
    for (const auto& [key, schedule] : section_schedules) {
        penalty += schedule_distance_penalty(schedule, day_slots_.at(key.second), occupant_rooms);
    }
    for (const auto& [key, schedule] : instructor_schedules) {
        penalty += schedule_distance_penalty(schedule, day_slots_.at(key.second), occupant_rooms);
    }
    return penalty;
}

double QualityScorer::schedule_distance_penalty(DaySchedule schedule,
                                                const std::vector<std::string>& day_slots,
                                                const std::map<std::string, std::string>& occupant_rooms) const {
    if (schedule.size() < 2) {
        return 0.0;
    }
    std::sort(schedule.begin(), schedule.end());

    double penalty = 0.0;
    for (size_t i = 0; i + 1 < schedule.size(); ++i) {
        size_t cur = schedule[i].first;
        size_t next = schedule[i + 1].first;
        if (next != cur + 1) {
            continue;  // 連続していない
        }

        const std::string* room1 = &schedule[i].second;
        const std::string* room2 = &schedule[i + 1].second;
        if (config_.room_lookup == RoomLookup::AnyOccupant) {
            room1 = &occupant_rooms.at(day_slots[cur]);
            room2 = &occupant_rooms.at(day_slots[next]);
        }

        int distance = room_distance(*room1, *room2);
        if (distance > config_.room_distance_threshold) {
            penalty += static_cast<double>(distance) * config_.weights.room_distance;
        }
    }
    return penalty;
}

} // namespace jikanwari_csp
