#include "shift_roster/reporter.hpp"
#include "shift_roster/staffing.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <string>

namespace shift_roster {

namespace {

constexpr size_t kMinorUnfilledLimit = 5;
constexpr size_t kMinorUnderstaffedLimit = 3;

const std::string kRule(80, '-');
const std::string kBanner(80, '=');

} // namespace

std::string to_string(SlotStatus status) {
    switch (status) {
        case SlotStatus::Filled:   return "filled";
        case SlotStatus::Unfilled: return "unfilled";
        case SlotStatus::Mismatch: return "mismatch";
    }
    return "unfilled";
}

std::string to_string(StaffingStatus status) {
    return status == StaffingStatus::Met ? "met" : "understaffed";
}

std::string to_string(RosterStatus status) {
    return status == RosterStatus::Approved ? "approved" : "needs_review";
}

size_t CoverageReport::understaffed_count() const {
    return static_cast<size_t>(std::count_if(staffing_checks.begin(), staffing_checks.end(),
        [](const StaffingCheck& c) { return c.status == StaffingStatus::Understaffed; }));
}

size_t CoverageReport::met_count() const {
    return staffing_checks.size() - understaffed_count();
}

CoverageReporter::CoverageReporter(const Problem& problem, RunContext& context)
    : problem_(problem)
    , context_(context) {}

bool CoverageReporter::slot_filled(const std::string& available, const std::string& assigned,
                                   const Worker& worker, int day) const {
    if (assigned == available || worker.offers(day, assigned)) {
        return true;
    }
    return problem_.constraints
        && (problem_.constraints->is_flexible(assigned) || problem_.constraints->is_flexible(available));
}

std::vector<AvailabilityCheck> CoverageReporter::check_availability(const Schedule& schedule) const {
    std::vector<AvailabilityCheck> checks;
    for (const auto& worker : problem_.workers) {
        for (int day = 1; day <= kHorizonDays; ++day) {
            auto requested = worker.requested_code(day);
            if (!requested) {
                continue;
            }
            AvailabilityCheck check;
            check.worker_id = worker.id;
            check.worker_name = worker.name;
            check.date = problem_.date_of(day);
            check.available_shift = *requested;

            const Assignment* a = schedule.find(worker.id, check.date);
            if (!a) {
                check.status = SlotStatus::Unfilled;
            } else {
                check.assigned_shift = a->shift_code;
                check.status = slot_filled(*requested, a->shift_code, worker, day)
                             ? SlotStatus::Filled : SlotStatus::Mismatch;
            }
            checks.push_back(std::move(check));
        }
    }
    return checks;
}

std::vector<StaffingCheck> CoverageReporter::check_staffing(const Schedule& schedule) const {
    std::map<std::string, std::set<Date>> active_dates;
    for (const auto& a : schedule.assignments()) {
        active_dates[a.store].insert(a.date);
    }
    StaffingLedger ledger = StaffingLedger::from_schedule(schedule);

    std::vector<StaffingCheck> checks;
    for (const auto& store : problem_.stores) {
        auto it = active_dates.find(store.name);
        if (it == active_dates.end()) {
            continue;
        }
        for (const Date& date : it->second) {
            for (const auto& [station, required] : store.station_minimums) {
                StaffingCheck check;
                check.store = store.name;
                check.date = date;
                check.station = station;
                check.required = required;
                check.assigned = ledger.count(store.name, date, station);
                check.status = check.assigned >= required
                             ? StaffingStatus::Met : StaffingStatus::Understaffed;
                check.details = "Required: " + std::to_string(required)
                              + ", Assigned: " + std::to_string(check.assigned);
                if (check.status == StaffingStatus::Understaffed) {
                    check.details += " (Shortage: " + std::to_string(required - check.assigned) + ")";
                }
                checks.push_back(std::move(check));
            }
        }
    }
    return checks;
}

double CoverageReporter::coverage_percent(const Schedule& schedule) const {
    auto checks = check_availability(schedule);
    if (checks.empty()) {
        return 0.0;
    }
    size_t filled = static_cast<size_t>(std::count_if(checks.begin(), checks.end(),
        [](const AvailabilityCheck& c) { return c.status == SlotStatus::Filled; }));
    double percent = static_cast<double>(filled) / static_cast<double>(checks.size()) * 100.0;
    return std::round(percent * 100.0) / 100.0;
}

CoverageReport CoverageReporter::build(const Schedule& schedule) const {
    CoverageReport report;
    report.availability_checks = check_availability(schedule);
    report.staffing_checks = check_staffing(schedule);

    report.total_slots = report.availability_checks.size();
    for (const auto& c : report.availability_checks) {
        switch (c.status) {
            case SlotStatus::Filled:   ++report.filled; break;
            case SlotStatus::Unfilled: ++report.unfilled; break;
            case SlotStatus::Mismatch: ++report.mismatched; break;
        }
    }
    if (report.total_slots > 0) {
        double percent = static_cast<double>(report.filled)
                       / static_cast<double>(report.total_slots) * 100.0;
        report.coverage_percent = std::round(percent * 100.0) / 100.0;
    }

    size_t understaffed = report.understaffed_count();
    if (report.unfilled == 0 && report.mismatched == 0 && understaffed == 0) {
        report.status = RosterStatus::Approved;
        report.summary = "Roster is complete and meets all requirements.";
    } else if (report.unfilled <= kMinorUnfilledLimit && understaffed <= kMinorUnderstaffedLimit) {
        report.status = RosterStatus::NeedsReview;
        report.summary = "Roster is mostly complete but has minor issues that need review.";
    } else {
        report.status = RosterStatus::NeedsReview;
        report.summary = "Roster has significant gaps that need attention.";
    }

    if (report.unfilled > 0) {
        report.recommendations.push_back(
            "Fill " + std::to_string(report.unfilled)
            + " unfilled availability slots to maximize employee utilization.");
    }
    if (report.mismatched > 0) {
        report.recommendations.push_back(
            "Review " + std::to_string(report.mismatched)
            + " shift assignments that don't match employee availability preferences.");
    }
    if (understaffed > 0) {
        report.recommendations.push_back(
            "Address " + std::to_string(understaffed)
            + " understaffed stations to meet operational requirements.");
    }
    if (report.recommendations.empty()) {
        report.recommendations.push_back("Roster is optimal. No changes needed.");
    }

    if (context_.verbose()) {
        context_.log() << "% [verbose] report: " << to_string(report.status)
                       << " coverage=" << format_hours(report.coverage_percent) << "%"
                       << " unfilled=" << report.unfilled
                       << " mismatched=" << report.mismatched
                       << " understaffed=" << understaffed << "\n";
    }
    return report;
}

void CoverageReporter::render(const CoverageReport& report, std::ostream& out) const {
    std::string status = to_string(report.status);
    std::transform(status.begin(), status.end(), status.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    out << kBanner << "\n"
        << "FINAL ROSTER CHECK REPORT\n"
        << kBanner << "\n\n"
        << "ROSTER STATUS: " << status << "\n"
        << report.summary << "\n\n";

    out << kRule << "\n"
        << "AVAILABILITY COVERAGE\n"
        << kRule << "\n"
        << "Total Availability Slots: " << report.total_slots << "\n"
        << "Filled Slots: " << report.filled << "\n"
        << "Unfilled Slots: " << report.unfilled << "\n"
        << "Mismatched Slots: " << report.mismatched << "\n"
        << "Coverage: " << format_hours(report.coverage_percent) << "%\n\n";

    if (report.unfilled > 0) {
        out << "UNFILLED AVAILABILITY SLOTS:\n";
        for (const auto& c : report.availability_checks) {
            if (c.status != SlotStatus::Unfilled) continue;
            out << "  - " << c.worker_name << " (" << c.worker_id << ") on "
                << c.date.to_string() << ": Available for " << c.available_shift
                << ", but not assigned\n";
        }
        out << "\n";
    }

    out << kRule << "\n"
        << "STAFFING REQUIREMENTS CHECK\n"
        << kRule << "\n"
        << "Total Staffing Checks: " << report.staffing_checks.size() << "\n"
        << "Requirements Met: " << report.met_count() << "\n"
        << "Understaffed: " << report.understaffed_count() << "\n";

    std::string current_store;
    Date current_date;
    bool first = true;
    for (const auto& c : report.staffing_checks) {
        if (first || c.store != current_store || c.date != current_date) {
            out << "\n" << c.store << " - " << c.date.to_string() << ":\n";
            current_store = c.store;
            current_date = c.date;
            first = false;
        }
        out << "  " << c.station << ": " << c.assigned << "/" << c.required
            << " (" << to_string(c.status) << ")\n";
        if (c.status == StaffingStatus::Understaffed) {
            out << "     " << c.details << "\n";
        }
    }

    out << "\n" << kRule << "\n"
        << "RECOMMENDATIONS\n"
        << kRule << "\n";
    for (size_t i = 0; i < report.recommendations.size(); ++i) {
        out << (i + 1) << ". " << report.recommendations[i] << "\n";
    }
    out << "\n" << kBanner << "\n"
        << "END OF REPORT\n"
        << kBanner << "\n";
}

} // namespace shift_roster
