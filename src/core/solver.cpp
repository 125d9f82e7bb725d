#include "jikanwari_csp/solver.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace jikanwari_csp {

const char* to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Solved: return "solved";
        case SolveStatus::Exhausted: return "exhausted";
        case SolveStatus::TimedOut: return "timed-out";
    }
    return "unknown";
}

UsageStats usage_stats(const Assignment& assignment) {
    UsageStats usage;
    usage.total_assigned = assignment.size();
    for (const auto& [id, value] : assignment) {
        usage.timeslot_usage[value.timeslot_id]++;
        usage.instructor_load[value.instructor_id]++;
        usage.room_usage[value.room_id]++;
    }
    return usage;
}

Solver::Solver()
    : rng_(std::random_device{}()) {}

void Solver::set_timeout(double seconds) {
    if (!(seconds >= 0.0)) {
        throw std::invalid_argument("Timeout must be non-negative");
    }
    timeout_seconds_ = seconds;
}

void Solver::set_progress_interval(size_t iterations) {
    if (iterations == 0) {
        throw std::invalid_argument("Progress interval must be positive");
    }
    progress_interval_ = iterations;
}

SolveResult Solver::solve(const Model& model) {
    if (model.empty()) {
        throw std::invalid_argument("Model has no lectures to schedule");
    }

    // 初期化
    assignment_.clear();
    assigned_.assign(model.size(), false);
    stats_ = SolverStats{};
    start_time_ = std::chrono::steady_clock::now();

    SolveResult result;

    // 空の定義域があれば探索せずに失敗
    auto empty = model.empty_domains();
    if (!empty.empty()) {
        if (verbose_) {
            std::cerr << "% [verbose] empty domain: " << model.lectures()[empty.front()].key()
                      << " (" << empty.size() << " lectures)\n";
        }
        result.status = SolveStatus::Exhausted;
        stats_.elapsed_seconds = elapsed_seconds();
        result.stats = stats_;
        return result;
    }

    if (verbose_) {
        std::cerr << "% [verbose] search start: " << model.size()
                  << " lectures, timeout " << timeout_seconds_ << "s\n";
    }

    auto res = run_search(model, 0);
    stats_.elapsed_seconds = elapsed_seconds();

    switch (res) {
        case SearchResult::SAT:
            result.status = SolveStatus::Solved;
            result.assignment = assignment_;
            break;
        case SearchResult::UNSAT:
            result.status = SolveStatus::Exhausted;
            break;
        case SearchResult::UNKNOWN:
            result.status = SolveStatus::TimedOut;
            break;
    }
    result.stats = stats_;

    if (verbose_) {
        std::cerr << "% [verbose] search " << to_string(result.status)
                  << ": iterations=" << stats_.iterations
                  << " backtracks=" << stats_.backtracks
                  << " best=" << stats_.best_assigned << "/" << model.size()
                  << " time=" << stats_.elapsed_seconds << "s\n";
    }
    return result;
}

Solver::SearchResult Solver::run_search(const Model& model, size_t depth) {
    stats_.iterations++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }
    if (assignment_.size() > stats_.best_assigned) {
        stats_.best_assigned = assignment_.size();
    }

    if (progress_ && stats_.iterations % progress_interval_ == 0) {
        progress_(assignment_.size(), model.size(), stats_.iterations);
    }

    // 全変数が割り当て済み
    if (assignment_.size() == model.size()) {
        return SearchResult::SAT;
    }

    // タイムアウトチェック
    if (timed_out()) {
        if (verbose_) {
            std::cerr << "% [verbose] timeout at depth " << depth << "\n";
        }
        return SearchResult::UNKNOWN;
    }

    // 変数選択
    size_t remaining = 0;
    size_t var_idx = select_variable(model, remaining);
    if (var_idx == SIZE_MAX || remaining == 0) {
        return SearchResult::UNSAT;
    }

    const LectureId& id = model.lectures()[var_idx];

    // 値をランダム順で試す
    std::vector<AssignmentValue> values = model.domain(var_idx).values();
    std::shuffle(values.begin(), values.end(), rng_);

    for (const auto& value : values) {
        if (!is_consistent(id, value, assignment_)) {
            continue;
        }

        assignment_.assign(id, value);
        assigned_[var_idx] = true;

        auto res = run_search(model, depth + 1);
        if (res != SearchResult::UNSAT) {
            return res;  // SAT または時間切れ（巻き戻さずに抜ける）
        }

        // バックトラック
        assignment_.unassign(id);
        assigned_[var_idx] = false;
        stats_.backtracks++;
    }

    return SearchResult::UNSAT;
}

size_t Solver::select_variable(const Model& model, size_t& remaining) const {
    size_t best = SIZE_MAX;
    size_t best_count = SIZE_MAX;

    for (size_t i = 0; i < model.size(); ++i) {
        if (assigned_[i]) {
            continue;
        }
        // 同数なら先に見つかった変数を優先するので、best_count に達したら数えなくてよい
        size_t count = count_consistent_values(model, i, best_count);
        if (count < best_count) {
            best = i;
            best_count = count;
            if (best_count == 0) {
                break;
            }
        }
    }

    remaining = best == SIZE_MAX ? 0 : best_count;
    return best;
}

size_t Solver::count_consistent_values(const Model& model, size_t var_idx, size_t limit) const {
    const LectureId& id = model.lectures()[var_idx];
    size_t count = 0;
    for (const auto& value : model.domain(var_idx)) {
        if (is_consistent(id, value, assignment_)) {
            if (++count >= limit) {
                break;
            }
        }
    }
    return count;
}

bool Solver::timed_out() const {
    return elapsed_seconds() > timeout_seconds_;
}

double Solver::elapsed_seconds() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
    return elapsed.count();
}

} // namespace jikanwari_csp
