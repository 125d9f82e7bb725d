/**
 * @file solver.hpp
 * @brief バックトラック探索ソルバー（MRV変数選択、ランダム値順序、時間制限）
 */
#ifndef JIKANWARI_CSP_SOLVER_HPP
#define JIKANWARI_CSP_SOLVER_HPP

#include "jikanwari_csp/constraint.hpp"
#include "jikanwari_csp/model.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>

namespace jikanwari_csp {

/**
 * @brief 求解の終了状態
 *
 * Exhausted と TimedOut はどちらも「使える解がない」として扱う。
 * 区別は診断のためだけにある（TimedOut は解が存在しないことを意味しない）。
 */
enum class SolveStatus {
    Solved,     // 完全割り当てが見つかった
    Exhausted,  // 探索し尽くした（または空の定義域を検出した）
    TimedOut    // 時間制限に達した
};

/**
 * @brief 状態名 ("solved" / "exhausted" / "timed-out")
 */
const char* to_string(SolveStatus status);

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t iterations = 0;      // 再帰呼び出しの回数
    size_t backtracks = 0;      // 割り当ての取り消し回数
    size_t max_depth = 0;
    size_t best_assigned = 0;   // 到達した最大の部分割り当てサイズ
    double elapsed_seconds = 0.0;
};

/**
 * @brief 求解結果
 */
struct SolveResult {
    SolveStatus status = SolveStatus::Exhausted;
    std::optional<Assignment> assignment;  ///< Solved のときのみ値を持つ
    SolverStats stats;

    bool solved() const { return status == SolveStatus::Solved; }
};

/**
 * @brief 進捗コールバック (割り当て済み数, 変数総数, 反復回数)
 *
 * 値のみを受け取り、ソルバーの状態には触れない。
 */
using ProgressCallback = std::function<void(size_t assigned, size_t total, size_t iterations)>;

/**
 * @brief 時限・教員・教室ごとの使用数
 */
struct UsageStats {
    size_t total_assigned = 0;
    std::map<std::string, size_t> timeslot_usage;
    std::map<std::string, size_t> instructor_load;
    std::map<std::string, size_t> room_usage;
};

/**
 * @brief 割り当ての使用状況を集計
 */
UsageStats usage_stats(const Assignment& assignment);

/**
 * @brief 時間割CSPソルバー
 *
 * 単純な時系列バックトラック探索：
 * - MRV 変数選択（現在の部分割り当てと整合する値の数が最小の変数、同数なら登録順）
 * - 値順序は定義域を一様にシャッフル
 * - 割り当て → 再帰 → 失敗したら取り消し
 * - 各再帰ステップで経過時間を確認し、制限を超えたら TimedOut
 *
 * 割り当て状態はインスタンスが保持するため、1つのインスタンスを
 * 複数スレッドから同時に solve() してはならない。
 */
class Solver {
public:
    /// デフォルトの時間制限（秒）
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 300.0;

    /// デフォルトの進捗報告間隔（反復回数）
    static constexpr size_t DEFAULT_PROGRESS_INTERVAL = 100;

    /**
     * @brief std::random_device で乱数を初期化したソルバーを作成
     */
    Solver();

    /**
     * @brief 解を1つ探索
     * @param model 解くモデル
     * @return 求解結果（解が見つからなくても例外にはならない）
     * @throws std::invalid_argument 変数が1つもない場合
     */
    SolveResult solve(const Model& model);

    /**
     * @brief 時間制限を設定（秒）
     * @throws std::invalid_argument 負の値の場合
     */
    void set_timeout(double seconds);
    double timeout() const { return timeout_seconds_; }

    /**
     * @brief 乱数シードを固定する（テスト用の再現性確保）
     */
    void set_seed(uint32_t seed) { rng_.seed(seed); }

    /**
     * @brief 進捗コールバックを設定
     */
    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * @brief 進捗報告の間隔を設定
     * @throws std::invalid_argument 0 の場合
     */
    void set_progress_interval(size_t iterations);

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 現在の割り当て状態（探索終了後は最後の状態）
     */
    const Assignment& assignment() const { return assignment_; }

private:
    /**
     * @brief 探索結果（内部用）
     */
    enum class SearchResult {
        SAT,      // 解が見つかった
        UNSAT,    // この枝には解がない
        UNKNOWN   // 時間切れ
    };

    /**
     * @brief 再帰探索
     */
    SearchResult run_search(const Model& model, size_t depth);

    /**
     * @brief 次に割り当てる変数を選択（MRV）
     * @param remaining 選択した変数の残り値数を返す
     * @return 変数インデックス（未割り当て変数が無ければ SIZE_MAX）
     */
    size_t select_variable(const Model& model, size_t& remaining) const;

    /**
     * @brief 現在の割り当てと整合する値の数を数える
     * @param limit この数に達したら数えるのをやめる
     */
    size_t count_consistent_values(const Model& model, size_t var_idx, size_t limit) const;

    /**
     * @brief 経過時間が制限を超えたか
     */
    bool timed_out() const;

    double elapsed_seconds() const;

    // 設定
    double timeout_seconds_ = DEFAULT_TIMEOUT_SECONDS;
    size_t progress_interval_ = DEFAULT_PROGRESS_INTERVAL;
    ProgressCallback progress_;
    bool verbose_ = false;

    // 状態
    Assignment assignment_;
    std::vector<bool> assigned_;
    std::chrono::steady_clock::time_point start_time_;

    // 統計
    SolverStats stats_;

    // 乱数
    std::mt19937 rng_;
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_SOLVER_HPP
