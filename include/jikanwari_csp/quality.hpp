/**
 * @file quality.hpp
 * @brief 完成した時間割の品質スコア（ソフト制約）
 */
#ifndef JIKANWARI_CSP_QUALITY_HPP
#define JIKANWARI_CSP_QUALITY_HPP

#include "jikanwari_csp/constraint.hpp"
#include "jikanwari_csp/entities.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief ソフト制約の重み
 */
struct QualityWeights {
    double gap = 10.0;            // 空きコマ1つあたりのペナルティ
    double balance = 5.0;         // 曜日の偏りの少なさに対するボーナス係数
    double early = 3.0;           // 早い時限1コマあたりのペナルティ
    double late = 3.0;            // 遅い時限1コマあたりのペナルティ
    double room_distance = 8.0;   // 連続コマの教室間距離に対する係数
};

/**
 * @brief 連続コマの教室をどこから取るか
 */
enum class RoomLookup {
    ScheduleOwner,  // 評価中のクラス/教員自身の講義コマの教室
    AnyOccupant     // その時限を使っている任意の講義コマの教室（LectureId 順で最後のもの）
};

/**
 * @brief 品質スコアの設定
 */
struct QualityConfig {
    QualityWeights weights;
    std::set<std::string> early_timeslots{"TS0", "TS4", "TS8", "TS12", "TS16"};
    std::set<std::string> late_timeslots{"TS3", "TS7", "TS11", "TS15", "TS19"};
    int room_distance_threshold = 2;  // これを超える距離のみペナルティ
    bool balance_over_all_weekdays = false;  // true なら授業の無い曜日も 0 として数える
    RoomLookup room_lookup = RoomLookup::ScheduleOwner;
};

/**
 * @brief スコアの内訳
 *
 * total = base - gap_penalty + balance_bonus - time_preference_penalty - room_distance_penalty
 */
struct QualityBreakdown {
    double base = 0.0;
    double gap_penalty = 0.0;
    double balance_bonus = 0.0;
    double time_preference_penalty = 0.0;
    double room_distance_penalty = 0.0;
    double total = 0.0;
};

/**
 * @brief 教室間の抽象距離
 *
 * 同じ ID なら 0。英字の接頭辞が同じなら末尾の番号差 / 5（整数除算）、
 * 番号が読めなければ（数字以外を含む、19桁以上）1。接頭辞が異なれば 3。
 */
int room_distance(const std::string& room1, const std::string& room2);

/**
 * @brief 品質スコア計算器
 *
 * 完全割り当てに対してのみ使い、探索には影響しない。
 * 全ての評価関数は副作用を持たず、同じ入力に対して同じ値を返す。
 */
class QualityScorer {
public:
    /// 基準点
    static constexpr double BASE_SCORE = 1000.0;

    /// 偏りボーナスの上限（標準偏差がこれ以上ならボーナス 0）
    static constexpr double BALANCE_CEILING = 5.0;

    /**
     * @brief 時限の並びを参照データから読み取る（reference は構築後に保持しない）
     */
    explicit QualityScorer(const ReferenceData& reference, QualityConfig config = QualityConfig{});

    /**
     * @brief スコアと内訳を計算
     * @throws std::runtime_error 参照テーブルに無い時限 ID が含まれる場合
     */
    QualityBreakdown evaluate(const Assignment& assignment) const;

    /**
     * @brief スコアのみを計算
     */
    double score(const Assignment& assignment) const { return evaluate(assignment).total; }

    /**
     * @brief 空きコマペナルティ
     *
     * クラス×曜日ごとに、最初と最後の授業の間にある使われていない時限の数 × 重み。
     */
    double gap_penalty(const Assignment& assignment) const;

    /**
     * @brief 曜日バランスボーナス
     *
     * クラスごとに曜日別コマ数の母標準偏差 sd を求め、max(0, 5 - sd) × 重み。
     */
    double balance_bonus(const Assignment& assignment) const;

    /**
     * @brief 時間帯ペナルティ（早い時限・遅い時限それぞれ独立に加算）
     */
    double time_preference_penalty(const Assignment& assignment) const;

    /**
     * @brief 連続コマの教室距離ペナルティ（クラス視点と教員視点の合計）
     */
    double room_distance_penalty(const Assignment& assignment) const;

    const QualityConfig& config() const { return config_; }

private:
    /**
     * @brief 1つの講義コマの曜日と曜日内の順位
     */
    struct SlotPlace {
        std::string weekday;
        size_t index;
    };

    /**
     * @brief (教室, 曜日内の順位) の列
     */
    using DaySchedule = std::vector<std::pair<size_t, std::string>>;

    const SlotPlace& place_of(const std::string& timeslot_id) const;

    double schedule_distance_penalty(DaySchedule schedule,
                                     const std::vector<std::string>& day_slots,
                                     const std::map<std::string, std::string>& occupant_rooms) const;

    QualityConfig config_;
    std::map<std::string, SlotPlace> places_;                    // timeslot_id -> 曜日内の位置
    std::map<std::string, std::vector<std::string>> day_slots_;  // 曜日 -> 時限 ID（順序付き）
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_QUALITY_HPP
