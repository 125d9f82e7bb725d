#include "jikanwari_csp/sample_instance.hpp"
#include "jikanwari_csp/timetable.hpp"
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-t SEC] [-r SEED] [-n N]\n";
    std::cerr << "  -s       Print solver statistics to stderr\n";
    std::cerr << "  -v       Verbose mode (print build/search progress)\n";
    std::cerr << "  -t SEC   Timeout in seconds (default 300)\n";
    std::cerr << "  -r SEED  Fix the random seed\n";
    std::cerr << "  -n N     Schedule only the first N sample sections\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const jikanwari_csp::TimetableResult& result) {
    if (!g_print_stats) return;
    const auto& s = result.solve.stats;
    std::cerr << "% Stats: status=" << jikanwari_csp::to_string(result.solve.status)
              << " iterations=" << s.iterations
              << " backtracks=" << s.backtracks
              << " max_depth=" << s.max_depth
              << " best=" << s.best_assigned << "/" << result.model.size()
              << " time=" << s.elapsed_seconds << "s\n";

    if (result.solve.assignment) {
        auto usage = jikanwari_csp::usage_stats(*result.solve.assignment);
        std::cerr << "% Usage: timeslots=" << usage.timeslot_usage.size()
                  << " instructors=" << usage.instructor_load.size()
                  << " rooms=" << usage.room_usage.size() << "\n";
    }
}

void print_solution(const jikanwari_csp::Assignment& assignment) {
    for (const auto& [id, value] : assignment) {
        std::cout << id.key() << " = (" << value.timeslot_id << ", " << value.room_id
                  << ", " << value.instructor_id << ");\n";
    }
    std::cout << "----------\n";
}

void print_quality(const jikanwari_csp::QualityBreakdown& q) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "% quality: base=" << q.base
              << " gap=-" << q.gap_penalty
              << " balance=+" << q.balance_bonus
              << " time=-" << q.time_preference_penalty
              << " room=-" << q.room_distance_penalty
              << " total=" << q.total << "\n";
}

int main(int argc, char* argv[]) {
    jikanwari_csp::GenerateOptions options;
    int section_limit = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            options.timeout_seconds = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            options.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            section_limit = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    options.verbose = g_verbose;

    try {
        auto reference = jikanwari_csp::sample_reference_data();
        auto sections = jikanwari_csp::sample_section_ids();
        if (section_limit > 0 && static_cast<size_t>(section_limit) < sections.size()) {
            sections.resize(static_cast<size_t>(section_limit));
        }

        auto result = jikanwari_csp::generate_timetable(reference, sections, options);
        for (const auto& msg : result.model.diagnostics()) {
            std::cerr << "% Warning: " << msg << "\n";
        }
        print_stats(result);

        switch (result.solve.status) {
            case jikanwari_csp::SolveStatus::Solved:
                print_solution(*result.solve.assignment);
                print_quality(*result.quality);
                std::cout << "==========\n";
                break;
            case jikanwari_csp::SolveStatus::TimedOut:
                std::cout << "=====UNKNOWN=====\n";
                break;
            case jikanwari_csp::SolveStatus::Exhausted:
                std::cout << "=====UNSATISFIABLE=====\n";
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
