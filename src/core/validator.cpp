#include "shift_roster/validator.hpp"

namespace shift_roster {

Validator::Validator()
    : rules_{
        std::make_shared<AvailabilityRule>(),
        std::make_shared<ManagerCoverageRule>(),
        std::make_shared<ShiftLengthRule>(),
        std::make_shared<RestPeriodRule>(),
        std::make_shared<StoreCoverageRule>(),
    } {}

Validator::Validator(std::vector<RulePtr> rules)
    : rules_(std::move(rules)) {}

std::vector<Violation> Validator::validate(const Schedule& schedule, const Problem& problem) const {
    std::vector<Violation> violations;
    for (const auto& rule : rules_) {
        rule->check(schedule, problem, violations);
    }
    return violations;
}

std::vector<Violation> Validator::validate(const Schedule& schedule, const Problem& problem,
                                           RunContext& context) const {
    std::vector<Violation> violations;
    for (const auto& rule : rules_) {
        size_t before = violations.size();
        rule->check(schedule, problem, violations);
        if (context.verbose()) {
            context.log() << "% [verbose] rule " << rule->name()
                          << ": " << (violations.size() - before) << " violations\n";
        }
    }
    return violations;
}

} // namespace shift_roster
