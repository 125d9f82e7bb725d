/**
 * @file timetable.hpp
 * @brief 時間割生成の一括処理（モデル構築 → 求解 → 品質評価）
 */
#ifndef JIKANWARI_CSP_TIMETABLE_HPP
#define JIKANWARI_CSP_TIMETABLE_HPP

#include "jikanwari_csp/entities.hpp"
#include "jikanwari_csp/model.hpp"
#include "jikanwari_csp/quality.hpp"
#include "jikanwari_csp/solver.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief 時間割生成のオプション
 */
struct GenerateOptions {
    double timeout_seconds = Solver::DEFAULT_TIMEOUT_SECONDS;
    std::optional<uint32_t> seed;  // 未設定なら毎回ランダム
    ProgressCallback progress;
    size_t progress_interval = Solver::DEFAULT_PROGRESS_INTERVAL;
    bool verbose = false;
    QualityConfig quality;
};

/**
 * @brief 時間割生成の結果
 *
 * 成功時は solve.assignment と quality が値を持つ。
 * 失敗時は solve.status（TimedOut / Exhausted）と solve.stats.best_assigned が診断情報になる。
 */
struct TimetableResult {
    Model model;
    SolveResult solve;
    std::optional<QualityBreakdown> quality;

    bool succeeded() const { return solve.solved(); }
};

/**
 * @brief 指定クラスの時間割を生成
 * @throws std::invalid_argument 時間制限が負、または講義コマが1つも作れない場合
 */
TimetableResult generate_timetable(const ReferenceData& reference,
                                   const std::vector<std::string>& section_ids,
                                   const GenerateOptions& options = GenerateOptions{});

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_TIMETABLE_HPP
