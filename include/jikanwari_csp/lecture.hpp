/**
 * @file lecture.hpp
 * @brief CSP変数（講義コマ）と割り当て値
 */
#ifndef JIKANWARI_CSP_LECTURE_HPP
#define JIKANWARI_CSP_LECTURE_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>

namespace jikanwari_csp {

/**
 * @brief 講義コマの識別子（CSP変数）
 *
 * (section_id, course_id, lecture_number) の3つ組。
 * lecture_number は同一クラス・同一科目の週内の何コマ目か（1 始まり）。
 * 問題インスタンス全体で一意であり、そのまま map のキーとして使う。
 */
struct LectureId {
    std::string section_id;
    std::string course_id;
    int lecture_number = 0;

    /**
     * @brief 表示用の識別キー "<section>_<course>_L<n>"
     */
    std::string key() const;

    bool operator==(const LectureId& other) const {
        return lecture_number == other.lecture_number &&
               section_id == other.section_id &&
               course_id == other.course_id;
    }

    bool operator!=(const LectureId& other) const { return !(*this == other); }

    bool operator<(const LectureId& other) const {
        return std::tie(section_id, course_id, lecture_number) <
               std::tie(other.section_id, other.course_id, other.lecture_number);
    }
};

/**
 * @brief LectureId のハッシュ
 */
struct LectureIdHash {
    size_t operator()(const LectureId& id) const;
};

/**
 * @brief 割り当て値 (timeslot, room, instructor)
 */
struct AssignmentValue {
    std::string timeslot_id;
    std::string room_id;
    std::string instructor_id;

    bool operator==(const AssignmentValue& other) const {
        return timeslot_id == other.timeslot_id &&
               room_id == other.room_id &&
               instructor_id == other.instructor_id;
    }

    bool operator!=(const AssignmentValue& other) const { return !(*this == other); }
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_LECTURE_HPP
