#include "shift_roster/run_context.hpp"

namespace shift_roster {

std::string to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::Blacklisted:      return "blacklisted";
        case SkipReason::ProblematicShift: return "problematic_shift";
        case SkipReason::RestFlagged:      return "rest_flagged";
        case SkipReason::DailyCap:         return "daily_cap";
        case SkipReason::WeeklyCap:        return "weekly_cap";
        case SkipReason::RestPeriod:       return "rest_period";
        case SkipReason::StationCapacity:  return "station_capacity";
    }
    return "unknown";
}

void RunContext::record_skip(SkipRecord record) {
    if (verbose_) {
        *log_ << "% [verbose] skip " << record.worker_id
              << " " << record.date.to_string()
              << " " << record.shift_code
              << " (" << to_string(record.reason) << ")\n";
    }
    skips_.push_back(std::move(record));
}

std::map<SkipReason, size_t> RunContext::skip_counts(int iteration) const {
    std::map<SkipReason, size_t> counts;
    for (const auto& s : skips_) {
        if (s.iteration == iteration) {
            counts[s.reason]++;
        }
    }
    return counts;
}

void RunContext::record_iteration(const IterationRecord& record) {
    history_.push_back(record);
    if (print_stats_) {
        *log_ << "% Stats: iteration=" << record.iteration
              << " assignments=" << record.assignments
              << " hours=" << format_hours(record.hours)
              << " violations=" << record.violations
              << " critical=" << record.critical
              << " new_keys=" << record.new_keys
              << " skips=" << record.skips
              << " coverage=" << format_hours(record.coverage_percent) << "%\n";
    }
}

} // namespace shift_roster
