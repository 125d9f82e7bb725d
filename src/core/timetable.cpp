#include "jikanwari_csp/timetable.hpp"
#include "jikanwari_csp/model_builder.hpp"
#include <iostream>

namespace jikanwari_csp {

TimetableResult generate_timetable(const ReferenceData& reference,
                                   const std::vector<std::string>& section_ids,
                                   const GenerateOptions& options) {
    // 設定の検証は構築・探索の前に行う
    Solver solver;
    solver.set_timeout(options.timeout_seconds);
    solver.set_progress_interval(options.progress_interval);
    solver.set_verbose(options.verbose);
    if (options.seed) {
        solver.set_seed(*options.seed);
    }
    if (options.progress) {
        solver.set_progress_callback(options.progress);
    }

    TimetableResult result;

    ModelBuilder builder(reference);
    builder.set_verbose(options.verbose);
    result.model = builder.build(section_ids);

    result.solve = solver.solve(result.model);

    if (result.solve.solved()) {
        QualityScorer scorer(reference, options.quality);
        result.quality = scorer.evaluate(*result.solve.assignment);
        if (options.verbose) {
            std::cerr << "% [verbose] quality score: " << result.quality->total << "\n";
        }
    }
    return result;
}

} // namespace jikanwari_csp
