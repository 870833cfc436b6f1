#include "shift_roster/rules/coverage.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace shift_roster {

// ============================================================================
// ManagerCoverageRule implementation
// ============================================================================

std::string ManagerCoverageRule::name() const {
    return "manager_coverage";
}

void ManagerCoverageRule::check(const Schedule& schedule, const Problem& problem,
                                std::vector<Violation>& out) const {
    auto is_manager_tagged = [&problem](const Assignment& a) {
        if (!a.has_manager()) return false;
        if (problem.managers.empty()) return true;
        return std::any_of(problem.managers.begin(), problem.managers.end(),
                           [&a](const Manager& m) { return m.id == a.manager_id; });
    };

    std::map<std::pair<Date, std::string>, std::vector<const Assignment*>> groups;
    for (const auto& a : schedule.assignments()) {
        groups[std::make_pair(a.date, a.shift_time)].push_back(&a);
    }

    for (const auto& [key, members] : groups) {
        bool covered = std::any_of(members.begin(), members.end(),
                                   [&](const Assignment* a) { return is_manager_tagged(*a); });
        if (covered) {
            continue;
        }

        const Date& date = key.first;
        const std::string& shift_time = key.second;

        Violation v;
        v.severity = Severity::Critical;
        v.date = date;
        v.shift_code = members.front()->shift_code;
        v.message = "No manager assigned to shifts on " + date.to_string() + " at " + shift_time;
        v.recommendation = "Assign a manager to at least one shift on "
                         + date.to_string() + " at " + shift_time;
        v.detail = ManagerCoverageDetail{shift_time, members.size()};
        out.push_back(std::move(v));
    }
}

// ============================================================================
// StoreCoverageRule implementation
// ============================================================================

std::string StoreCoverageRule::name() const {
    return "store_coverage";
}

void StoreCoverageRule::check(const Schedule& schedule, const Problem& problem,
                              std::vector<Violation>& out) const {
    std::map<std::pair<std::string, Date>, std::set<std::string>> covered;
    for (const auto& a : schedule.assignments()) {
        covered[std::make_pair(a.store, a.date)].insert(a.station);
    }

    for (const auto& store : problem.stores) {
        for (const auto& [key, stations] : covered) {
            if (key.first != store.name) {
                continue;
            }

            std::vector<std::string> missing;
            for (const auto& [station, required] : store.station_minimums) {
                if (required > 0 && stations.count(station) == 0) {
                    missing.push_back(station);
                }
            }
            if (missing.empty()) {
                continue;
            }

            std::string list;
            for (size_t i = 0; i < missing.size(); ++i) {
                if (i > 0) list += ", ";
                list += missing[i];
            }

            const Date& date = key.second;
            Violation v;
            v.severity = Severity::Warning;
            v.date = date;
            v.message = "Store " + store.name + " missing coverage for stations: " + list
                      + " on " + date.to_string();
            v.recommendation = "Assign staff to " + list + " at " + store.name;
            v.detail = StoreCoverageDetail{store.name, missing};
            out.push_back(std::move(v));
        }
    }
}

} // namespace shift_roster
