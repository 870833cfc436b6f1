#include "shift_roster/rules/labour.hpp"
#include <algorithm>
#include <map>

namespace shift_roster {

// ============================================================================
// ShiftLengthRule implementation
// ============================================================================

std::string ShiftLengthRule::name() const {
    return "shift_length";
}

void ShiftLengthRule::check(const Schedule& schedule, const Problem& problem,
                            std::vector<Violation>& out) const {
    const ConstraintParams& limits = problem.limits();

    for (const auto& a : schedule.assignments()) {
        bool under = a.hours < limits.min_shift_hours;
        bool over = a.hours > limits.max_shift_hours;
        if (!under && !over) {
            continue;
        }

        Violation v;
        v.severity = Severity::Critical;
        v.worker_id = a.worker_id;
        v.worker_name = a.worker_name;
        v.date = a.date;
        v.shift_code = a.shift_code;
        if (under) {
            v.message = "Shift length " + format_hours(a.hours) + " hours is below minimum "
                      + format_hours(limits.min_shift_hours) + " hours";
            v.recommendation = "Extend the shift to at least "
                             + format_hours(limits.min_shift_hours) + " hours";
            v.detail = ShiftLengthDetail{a.hours, limits.min_shift_hours, LengthBound::Under};
        } else {
            v.message = "Shift length " + format_hours(a.hours) + " hours exceeds maximum "
                      + format_hours(limits.max_shift_hours) + " hours";
            v.recommendation = "Shorten the shift to at most "
                             + format_hours(limits.max_shift_hours) + " hours";
            v.detail = ShiftLengthDetail{a.hours, limits.max_shift_hours, LengthBound::Over};
        }
        out.push_back(std::move(v));
    }
}

// ============================================================================
// RestPeriodRule implementation
// ============================================================================

std::string RestPeriodRule::name() const {
    return "rest_period";
}

void RestPeriodRule::check(const Schedule& schedule, const Problem& problem,
                           std::vector<Violation>& out) const {
    const ConstraintParams& limits = problem.limits();

    std::map<std::string, std::vector<const Assignment*>> by_worker;
    for (const auto& a : schedule.assignments()) {
        by_worker[a.worker_id].push_back(&a);
    }

    for (auto& [worker_id, shifts] : by_worker) {
        std::sort(shifts.begin(), shifts.end(), [](const Assignment* x, const Assignment* y) {
            if (x->date != y->date) return x->date < y->date;
            return x->shift_time < y->shift_time;
        });

        for (size_t i = 1; i < shifts.size(); ++i) {
            const Assignment* prev = shifts[i - 1];
            const Assignment* next = shifts[i];
            if (next->date.days() - prev->date.days() != 1) {
                continue;
            }
            auto rest = rest_hours_between(prev->date, prev->shift_time,
                                           next->date, next->shift_time);
            if (!rest || *rest >= limits.min_rest_hours) {
                continue;
            }

            Violation v;
            v.severity = Severity::Critical;
            v.worker_id = worker_id;
            v.worker_name = next->worker_name;
            v.date = next->date;
            v.shift_code = next->shift_code;
            v.message = "Employee " + next->worker_name + " has only " + format_hours(*rest)
                      + " hours rest between shifts on " + prev->date.to_string()
                      + " and " + next->date.to_string()
                      + " (minimum " + format_hours(limits.min_rest_hours) + " required)";
            v.recommendation = "Move the shift on " + next->date.to_string()
                             + " later or give it to another employee";
            v.detail = RestPeriodDetail{*rest, limits.min_rest_hours, prev->date};
            out.push_back(std::move(v));
        }
    }
}

} // namespace shift_roster
