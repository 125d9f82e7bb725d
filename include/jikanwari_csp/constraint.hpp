/**
 * @file constraint.hpp
 * @brief 割り当て状態とハード制約（教員・教室・クラスの重複禁止）
 */
#ifndef JIKANWARI_CSP_CONSTRAINT_HPP
#define JIKANWARI_CSP_CONSTRAINT_HPP

#include "jikanwari_csp/lecture.hpp"
#include <array>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief ハード制約の種類
 */
enum class ConflictKind {
    Instructor,  // 同じ教員が同じ時限に2コマ以上
    Room,        // 同じ教室が同じ時限に2コマ以上
    Section      // 同じクラスが同じ時限に2コマ以上
};

/**
 * @brief 制約種類の名前 ("instructor" / "room" / "section")
 */
const char* to_string(ConflictKind kind);

/**
 * @brief 制約違反の記録
 *
 * (kind, resource_id, timeslot_id) ごとに1件。resource_id は kind に応じて
 * 教員 ID・教室 ID・クラス ID のいずれか。
 */
struct Conflict {
    ConflictKind kind;
    std::string resource_id;
    std::string timeslot_id;
    std::vector<LectureId> lectures;  ///< 重複している講義コマ（LectureId 順）

    /**
     * @brief 1行の説明文
     */
    std::string describe() const;
};

/**
 * @brief 講義コマへの割り当て（部分割り当て・完全割り当ての両方）
 *
 * LectureId -> AssignmentValue の対応を1つだけ保持し、
 * 割り当て時に挿入、取り消し時に削除する（コピーは作らない）。
 * (教員, 時限)・(教室, 時限)・(クラス, 時限) ごとの占有数を差分更新するため、
 * 整合性判定は割り当て全体を走査せずに行える。
 */
class Assignment {
public:
    using map_type = std::map<LectureId, AssignmentValue>;
    using const_iterator = map_type::const_iterator;

    Assignment() = default;

    /**
     * @brief 値を割り当てる（割り当て済みなら上書き）
     */
    void assign(const LectureId& id, const AssignmentValue& value);

    /**
     * @brief 割り当てを取り消す
     * @return 割り当てが存在して削除されたらtrue
     */
    bool unassign(const LectureId& id);

    /**
     * @brief 全ての割り当てを取り消す
     */
    void clear();

    /**
     * @brief 割り当て値を取得（未割り当てなら nullptr）
     */
    const AssignmentValue* find(const LectureId& id) const;

    bool contains(const LectureId& id) const { return values_.count(id) > 0; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    /**
     * @brief (resource, timeslot) を占有している講義コマ数
     */
    size_t occupancy(ConflictKind kind, const std::string& resource_id,
                     const std::string& timeslot_id) const;

    /**
     * @brief 2コマ以上が重なっている (kind, resource, timeslot) の数
     */
    size_t violation_count() const { return violations_; }

private:
    using SlotKey = std::pair<std::string, std::string>;  // (resource, timeslot)

    static const std::string& resource_of(ConflictKind kind, const LectureId& id,
                                          const AssignmentValue& value);
    void occupy(const LectureId& id, const AssignmentValue& value);
    void release(const LectureId& id, const AssignmentValue& value);

    map_type values_;
    std::array<std::map<SlotKey, size_t>, 3> occupancy_;
    size_t violations_ = 0;

    friend bool is_consistent(const LectureId&, const AssignmentValue&, const Assignment&);
};

/**
 * @brief 値を追加した結果の割り当てがハード制約を満たすか
 *
 * assignment に id := value を適用した割り当て全体で判定する。
 * 既存の割り当てに違反が含まれていれば false。副作用なし。
 */
bool is_consistent(const LectureId& id, const AssignmentValue& value,
                   const Assignment& assignment);

/**
 * @brief 割り当て全体がハード制約を満たすか
 */
bool satisfies_hard_constraints(const Assignment& assignment);

/**
 * @brief 全ての制約違反を列挙（診断用、探索では使わない）
 *
 * 教員 → 教室 → クラスの順に、各 (resource, timeslot) の重複を1件ずつ返す。
 * 1組の講義コマが3種類とも重なっていれば3件になる。
 */
std::vector<Conflict> find_all_conflicts(const Assignment& assignment);

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_CONSTRAINT_HPP
