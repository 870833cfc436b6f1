#include "shift_roster/iteration_memory.hpp"

namespace shift_roster {

size_t IterationMemory::merge(const std::vector<Violation>& violations) {
    size_t added = 0;
    for (const auto& v : violations) {
        if (!keys_.insert(key_of(v)).second) {
            continue;
        }
        ++added;
        accumulated_.push_back(v);
        learn(v);
    }
    return added;
}

size_t IterationMemory::count_new(const std::vector<Violation>& violations) const {
    std::set<ViolationKey> seen;
    for (const auto& v : violations) {
        ViolationKey key = key_of(v);
        if (!keys_.count(key)) {
            seen.insert(key);
        }
    }
    return seen.size();
}

void IterationMemory::learn(const Violation& v) {
    if (v.worker_id.empty()) {
        // 店舗・シフト帯単位の違反は従業員の割当には反映しない
        return;
    }

    WorkerDay wd{v.worker_id, v.date};
    if (!v.shift_code.empty()) {
        problematic_.emplace(v.worker_id, v.date, v.shift_code);
    }

    switch (v.kind()) {
        case ViolationKind::Availability: {
            const auto& d = std::get<AvailabilityDetail>(v.detail);
            if (v.is_critical()) {
                blacklist_.insert(wd);
            } else if (d.requested) {
                preferences_[wd] = *d.requested;
            }
            break;
        }
        case ViolationKind::RestPeriod:
            rest_flags_[v.worker_id].insert(v.date);
            break;
        case ViolationKind::ShiftLength: {
            const auto& d = std::get<ShiftLengthDetail>(v.detail);
            length_issues_[wd] = LengthIssue{d.observed, d.bound, d.side};
            break;
        }
        case ViolationKind::ManagerCoverage:
        case ViolationKind::StoreCoverage:
            break;
    }
}

bool IterationMemory::is_blacklisted(const std::string& worker_id, const Date& date) const {
    return blacklist_.count(WorkerDay{worker_id, date}) > 0;
}

std::optional<std::string> IterationMemory::preferred_code(const std::string& worker_id,
                                                           const Date& date) const {
    auto it = preferences_.find(WorkerDay{worker_id, date});
    if (it == preferences_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool IterationMemory::is_problematic(const std::string& worker_id, const Date& date,
                                     const std::string& shift_code) const {
    return problematic_.count(std::make_tuple(worker_id, date, shift_code)) > 0;
}

bool IterationMemory::is_rest_flagged(const std::string& worker_id, const Date& date) const {
    auto it = rest_flags_.find(worker_id);
    return it != rest_flags_.end() && it->second.count(date) > 0;
}

std::optional<LengthIssue> IterationMemory::length_issue(const std::string& worker_id,
                                                         const Date& date) const {
    auto it = length_issues_.find(WorkerDay{worker_id, date});
    if (it == length_issues_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace shift_roster
