#include "shift_roster/staffing.hpp"
#include <algorithm>

namespace shift_roster {

StaffingLedger StaffingLedger::from_schedule(const Schedule& schedule) {
    StaffingLedger ledger;
    for (const auto& a : schedule.assignments()) {
        ledger.add(a.store, a.date, a.station);
    }
    return ledger;
}

void StaffingLedger::add(const std::string& store, const Date& date, const std::string& station) {
    counts_[std::make_tuple(store, date, station)]++;
}

int StaffingLedger::count(const std::string& store, const Date& date,
                          const std::string& station) const {
    auto it = counts_.find(std::make_tuple(store, date, station));
    return it == counts_.end() ? 0 : it->second;
}

std::map<std::string, int> StaffingLedger::deficits(const std::vector<StoreProfile>& stores,
                                                    const Date& date) const {
    std::map<std::string, int> result;
    for (const auto& store : stores) {
        for (const auto& [station, required] : store.station_minimums) {
            int shortage = required - count(store.name, date, station);
            if (shortage > 0) {
                result[station] += shortage;
            }
        }
    }
    return result;
}

std::vector<const Worker*> prioritize_workers(const std::vector<const Worker*>& order,
                                              const std::map<std::string, int>& deficits) {
    std::vector<const Worker*> result(order);
    std::stable_partition(result.begin(), result.end(), [&deficits](const Worker* w) {
        return deficits.count(w->station) > 0;
    });
    return result;
}

} // namespace shift_roster
