#include "shift_roster/controller.hpp"
#include "shift_roster/managers.hpp"

namespace shift_roster {

std::string to_string(ControllerState state) {
    switch (state) {
        case ControllerState::Generate: return "GENERATE";
        case ControllerState::Validate: return "VALIDATE";
        case ControllerState::Loop:     return "LOOP";
        case ControllerState::Finalize: return "FINALIZE";
    }
    return "FINALIZE";
}

IterationController::IterationController(const Problem& problem, RunContext& context,
                                         ControllerOptions options)
    : problem_(problem)
    , context_(context)
    , options_(options) {
    problem_.check_ready();
    if (options_.max_iterations < 1) {
        options_.max_iterations = 1;
    }
    if (problem_.managers.empty()) {
        problem_.managers = generate_managers(default_manager_count(problem_.workers.size()),
                                              options_.base_seed);
        if (context_.verbose()) {
            context_.log() << "% [verbose] generated " << problem_.managers.size()
                           << " managers\n";
        }
    }
}

bool IterationController::should_stop_early(int iteration, double coverage,
                                            size_t violation_count) const {
    return options_.early_stop
        && iteration + 1 >= options_.early_stop_min_iteration
        && coverage >= options_.early_stop_coverage
        && violation_count <= options_.early_stop_max_violations;
}

RunResult IterationController::run() {
    RunResult result;
    result.managers = problem_.managers;

    AssignmentEngine engine(problem_, context_);
    engine.set_base_seed(options_.base_seed);
    Validator validator;
    CoverageReporter reporter(problem_, context_);

    int iteration = 0;
    Schedule schedule;
    std::vector<Violation> violations;

    state_ = ControllerState::Generate;
    while (state_ != ControllerState::Finalize) {
        if (context_.verbose()) {
            context_.log() << "% [verbose] state " << to_string(state_)
                           << " iteration=" << iteration << "\n";
        }

        switch (state_) {
            case ControllerState::Generate:
                schedule = engine.generate(result.memory, iteration);
                state_ = ControllerState::Validate;
                break;

            case ControllerState::Validate: {
                violations = validator.validate(schedule, problem_, context_);
                double coverage = reporter.coverage_percent(schedule);

                IterationRecord record;
                record.iteration = iteration;
                record.assignments = schedule.shift_count();
                record.hours = schedule.total_hours();
                record.violations = violations.size();
                record.critical = count_critical(violations);
                record.new_keys = result.memory.count_new(violations);
                record.skips = engine.stats().skipped;
                record.coverage_percent = coverage;
                context_.record_iteration(record);

                result.iteration_violations.push_back(violations);
                if (callback_) {
                    callback_(iteration, schedule, violations);
                }

                if (violations.empty()) {
                    result.converged = true;
                    state_ = ControllerState::Finalize;
                } else if (iteration + 1 >= options_.max_iterations) {
                    state_ = ControllerState::Finalize;
                } else if (should_stop_early(iteration, coverage, violations.size())) {
                    result.stopped_early = true;
                    state_ = ControllerState::Finalize;
                } else {
                    state_ = ControllerState::Loop;
                }
                break;
            }

            case ControllerState::Loop: {
                size_t added = result.memory.merge(violations);
                if (context_.verbose()) {
                    context_.log() << "% [verbose] memory +" << added
                                   << " (total " << result.memory.size()
                                   << ", blacklist " << result.memory.blacklist_size() << ")\n";
                }
                ++iteration;
                state_ = ControllerState::Generate;
                break;
            }

            case ControllerState::Finalize:
                break;
        }
    }

    result.memory.merge(violations);
    result.iterations = iteration + 1;
    result.schedule = std::move(schedule);
    result.violations = std::move(violations);
    result.report = reporter.build(result.schedule);
    return result;
}

} // namespace shift_roster
