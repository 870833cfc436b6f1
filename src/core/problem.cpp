#include "shift_roster/problem.hpp"

namespace shift_roster {

int Problem::day_of(const Date& date) const {
    int64_t offset = date.days() - start.days();
    if (offset < 0 || offset >= kHorizonDays) {
        return 0;
    }
    return static_cast<int>(offset) + 1;
}

const Worker* Problem::find_worker(const std::string& id) const {
    for (const auto& w : workers) {
        if (w.id == id) return &w;
    }
    return nullptr;
}

const StoreProfile* Problem::find_store(const std::string& name) const {
    for (const auto& s : stores) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

const ConstraintParams& Problem::limits() const {
    if (!constraints) {
        throw DataUnavailable("No constraint parameters available");
    }
    return *constraints;
}

void Problem::check_ready() const {
    if (workers.empty()) {
        throw DataUnavailable("No workers available");
    }
    limits();
}

} // namespace shift_roster
