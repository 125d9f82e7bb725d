/**
 * @file entities.hpp
 * @brief 参照データ（科目・教員・教室・時限・クラス）と参照テーブル
 */
#ifndef JIKANWARI_CSP_ENTITIES_HPP
#define JIKANWARI_CSP_ENTITIES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief 科目の種別
 */
enum class CourseKind {
    Lecture,        // 講義のみ
    LectureAndLab   // 講義 + 実験（Lab 教室が必要）
};

/**
 * @brief 教室の種別
 */
enum class RoomKind {
    Lecture,
    Lab
};

/**
 * @brief 科目
 */
struct Course {
    std::string id;
    std::string name;
    int credits = 0;
    CourseKind kind = CourseKind::Lecture;

    /**
     * @brief Lab 教室が必要か
     */
    bool needs_lab() const { return kind == CourseKind::LectureAndLab; }

    /**
     * @brief 割り当て可能な教室種別
     */
    RoomKind required_room_kind() const {
        return needs_lab() ? RoomKind::Lab : RoomKind::Lecture;
    }
};

/**
 * @brief 教員
 *
 * unavailable_day が設定されている場合、その曜日の時限には割り当てない。
 */
struct Instructor {
    std::string id;
    std::string name;
    std::string role;
    std::vector<std::string> qualified_courses;
    std::optional<std::string> unavailable_day;

    /**
     * @brief 科目を担当できるか
     */
    bool can_teach(const std::string& course_id) const;

    /**
     * @brief 指定曜日に担当可能か
     */
    bool is_available_on(const std::string& weekday) const;
};

/**
 * @brief 教室
 */
struct Room {
    std::string id;
    RoomKind kind = RoomKind::Lecture;
    int capacity = 0;
};

/**
 * @brief 時限
 *
 * position は同一曜日内での順序（0 始まりである必要はない）。
 */
struct TimeSlot {
    std::string id;
    std::string weekday;
    int position = 0;
    std::string start_time;
    std::string end_time;
};

/**
 * @brief 学生クラス（同じ時間割を共有する学生の集団）
 */
struct Section {
    std::string id;
    int student_count = 0;
    std::vector<std::string> courses;  ///< 履修科目 ID（順序付き）
};

/**
 * @brief 参照テーブル
 *
 * 外部のデータ取り込み処理が構築し、ソルバー側は読み取りのみ行う。
 * 各テーブルは ID をキーとし、登録順も保持する（定義域の列挙順に使用）。
 */
class ReferenceData {
public:
    ReferenceData() = default;

    // ===== 登録 =====
    // 同じ ID の二重登録は std::invalid_argument を送出する

    void add_course(Course course);
    void add_instructor(Instructor instructor);
    void add_room(Room room);
    void add_timeslot(TimeSlot timeslot);
    void add_section(Section section);

    // ===== 検索（見つからなければ nullptr） =====

    const Course* find_course(const std::string& id) const;
    const Instructor* find_instructor(const std::string& id) const;
    const Room* find_room(const std::string& id) const;
    const TimeSlot* find_timeslot(const std::string& id) const;
    const Section* find_section(const std::string& id) const;

    // ===== 登録順の一覧 =====

    const std::vector<Course>& courses() const { return courses_; }
    const std::vector<Instructor>& instructors() const { return instructors_; }
    const std::vector<Room>& rooms() const { return rooms_; }
    const std::vector<TimeSlot>& timeslots() const { return timeslots_; }
    const std::vector<Section>& sections() const { return sections_; }

    /**
     * @brief 指定種別の教室一覧（登録順）
     */
    std::vector<const Room*> rooms_of_kind(RoomKind kind) const;

    /**
     * @brief 科目を担当できる教員一覧（登録順）
     */
    std::vector<const Instructor*> qualified_instructors(const std::string& course_id) const;

    /**
     * @brief 指定曜日の時限 ID を position 昇順で取得
     */
    std::vector<std::string> timeslots_on(const std::string& weekday) const;

    /**
     * @brief 曜日一覧（時限の登録順で初出順）
     */
    std::vector<std::string> weekdays() const;

private:
    std::vector<Course> courses_;
    std::vector<Instructor> instructors_;
    std::vector<Room> rooms_;
    std::vector<TimeSlot> timeslots_;
    std::vector<Section> sections_;

    // ID -> 各 vector 内のインデックス
    std::map<std::string, size_t> course_index_;
    std::map<std::string, size_t> instructor_index_;
    std::map<std::string, size_t> room_index_;
    std::map<std::string, size_t> timeslot_index_;
    std::map<std::string, size_t> section_index_;
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_ENTITIES_HPP
