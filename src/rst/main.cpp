#include "shift_roster/rst/model.hpp"
#include "shift_roster/controller.hpp"
#include "rst_parser.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] [-s] [-r] [-w] [-e] [-i N] [-S SEED] [-d DATE] <file.rst>\n";
    std::cerr << "  -v       Verbose mode (print engine/validator progress)\n";
    std::cerr << "  -s       Print per-iteration statistics to stderr\n";
    std::cerr << "  -r       Print the final coverage report\n";
    std::cerr << "  -w       Print the final violation list\n";
    std::cerr << "  -e       Stop early once coverage and violation targets are met\n";
    std::cerr << "  -i N     Maximum number of iterations (default 5)\n";
    std::cerr << "  -S SEED  Base random seed (default 42)\n";
    std::cerr << "  -d DATE  Horizon start date (YYYY-MM-DD), overrides the file\n";
}

bool g_print_stats = false;

void print_stats(const shift_roster::RunResult& result, const shift_roster::RunContext& context) {
    if (!g_print_stats) return;
    const auto& schedule = result.schedule;
    std::cerr << "% Stats: iterations=" << result.iterations
              << " assignments=" << schedule.shift_count()
              << " hours=" << shift_roster::format_hours(schedule.total_hours())
              << " paid_hours=" << shift_roster::format_hours(schedule.paid_hours())
              << " workers=" << schedule.distinct_workers()
              << " violations=" << result.violations.size()
              << " memory=" << result.memory.size()
              << " converged=" << (result.converged ? "true" : "false")
              << "\n";

    int last = result.iterations - 1;
    const auto counts = context.skip_counts(last);
    if (!counts.empty()) {
        std::cerr << "% Stats: skips";
        for (const auto& [reason, count] : counts) {
            std::cerr << " " << shift_roster::to_string(reason) << "=" << count;
        }
        std::cerr << "\n";
    }
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    bool verbose = false;
    bool print_report = false;
    bool print_violations = false;
    shift_roster::ControllerOptions options;
    std::optional<shift_roster::Date> start_override;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-r") == 0) {
            print_report = true;
        } else if (std::strcmp(argv[i], "-w") == 0) {
            print_violations = true;
        } else if (std::strcmp(argv[i], "-e") == 0) {
            options.early_stop = true;
        } else if (std::strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            options.max_iterations = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-S") == 0 && i + 1 < argc) {
            options.base_seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            start_override = shift_roster::Date::parse(argv[++i]);
            if (!start_override) {
                std::cerr << "Invalid date: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto rst_model = shift_roster::rst::parse_file(filename);
        shift_roster::Problem problem = rst_model->to_problem(start_override);

        shift_roster::RunContext context(std::cerr);
        context.set_verbose(verbose);
        context.set_print_stats(g_print_stats);

        shift_roster::IterationController controller(problem, context, options);
        auto result = controller.run();

        result.schedule.write_table(std::cout);

        if (print_violations) {
            for (const auto& v : result.violations) {
                std::cout << "% " << v << "\n";
            }
        }
        if (print_report) {
            shift_roster::CoverageReporter reporter(controller.problem(), context);
            reporter.render(result.report, std::cout);
        }
        print_stats(result, context);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
