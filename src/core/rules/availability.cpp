#include "shift_roster/rules/availability.hpp"

namespace shift_roster {

// ============================================================================
// AvailabilityRule implementation
// ============================================================================

std::string AvailabilityRule::name() const {
    return "availability";
}

void AvailabilityRule::check(const Schedule& schedule, const Problem& problem,
                             std::vector<Violation>& out) const {
    const ConstraintParams& limits = problem.limits();

    for (const auto& a : schedule.assignments()) {
        const Worker* worker = problem.find_worker(a.worker_id);
        if (!worker) {
            continue;
        }
        int day = problem.day_of(a.date);
        std::optional<std::string> requested;
        if (day > 0) {
            requested = worker->requested_code(day);
        }

        if (!requested) {
            Violation v;
            v.severity = Severity::Critical;
            v.worker_id = a.worker_id;
            v.worker_name = a.worker_name;
            v.date = a.date;
            v.shift_code = a.shift_code;
            v.message = "Employee " + a.worker_name + " assigned " + a.shift_code
                      + " on " + a.date.to_string() + " but is unavailable";
            v.recommendation = "Remove this shift or reassign it to an available employee";
            v.detail = AvailabilityDetail{std::nullopt, a.shift_code};
            out.push_back(std::move(v));
            continue;
        }

        if (worker->offers(day, a.shift_code)
            || limits.is_flexible(*requested) || limits.is_flexible(a.shift_code)) {
            continue;
        }

        Violation v;
        v.severity = Severity::Warning;
        v.worker_id = a.worker_id;
        v.worker_name = a.worker_name;
        v.date = a.date;
        v.shift_code = a.shift_code;
        v.message = "Employee " + a.worker_name + " assigned " + a.shift_code
                  + " on " + a.date.to_string() + " but requested " + *requested;
        v.recommendation = "Assign " + *requested + " as requested or confirm the change with the employee";
        v.detail = AvailabilityDetail{requested, a.shift_code};
        out.push_back(std::move(v));
    }
}

} // namespace shift_roster
