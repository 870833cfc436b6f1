#include "shift_roster/violation.hpp"
#include <algorithm>
#include <tuple>

namespace shift_roster {

std::string to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::Availability:    return "availability";
        case ViolationKind::ManagerCoverage: return "manager_coverage";
        case ViolationKind::ShiftLength:     return "shift_length";
        case ViolationKind::RestPeriod:      return "rest_period";
        case ViolationKind::StoreCoverage:   return "store_coverage";
    }
    return "unknown";
}

std::string to_string(Severity severity) {
    return severity == Severity::Critical ? "critical" : "warning";
}

bool ViolationKey::operator<(const ViolationKey& other) const {
    return std::tie(worker_id, date, kind, shift_code)
         < std::tie(other.worker_id, other.date, other.kind, other.shift_code);
}

bool ViolationKey::operator==(const ViolationKey& other) const {
    return worker_id == other.worker_id && date == other.date
        && kind == other.kind && shift_code == other.shift_code;
}

ViolationKey key_of(const Violation& violation) {
    return ViolationKey{violation.worker_id, violation.date, violation.kind(), violation.shift_code};
}

std::ostream& operator<<(std::ostream& os, const Violation& violation) {
    os << "[" << to_string(violation.severity) << "] "
       << to_string(violation.kind()) << " "
       << violation.date.to_string();
    if (!violation.worker_id.empty()) {
        os << " " << violation.worker_id;
    }
    if (!violation.shift_code.empty()) {
        os << " " << violation.shift_code;
    }
    os << ": " << violation.message;
    return os;
}

size_t count_critical(const std::vector<Violation>& violations) {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [](const Violation& v) { return v.is_critical(); }));
}

} // namespace shift_roster
