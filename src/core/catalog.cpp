#include "shift_roster/catalog.hpp"
#include <algorithm>
#include <cctype>

namespace shift_roster {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ===== ShiftCatalog =====

bool ShiftCatalog::add(ShiftDefinition def) {
    std::string code = def.code;
    return shifts_.emplace(code, std::move(def)).second;
}

const ShiftDefinition* ShiftCatalog::find(const std::string& code) const {
    auto it = shifts_.find(code);
    return it == shifts_.end() ? nullptr : &it->second;
}

std::string ShiftCatalog::time_of(const std::string& code) const {
    const ShiftDefinition* def = find(code);
    return def ? def->time : "TBD";
}

double ShiftCatalog::resolve_hours(const std::string& code, double fallback) const {
    const ShiftDefinition* def = find(code);
    if (def && def->hours > 0.0) {
        return def->hours;
    }
    auto inferred = infer_shift_hours(code, def ? def->name : std::string());
    return inferred ? *inferred : fallback;
}

std::optional<double> infer_shift_hours(const std::string& code, const std::string& name) {
    const std::string c = upper(code);
    const std::string lc = lower(code);
    const std::string n = lower(name);

    // "3F-L" や "SC2" のような派生コードも部分一致で拾う
    if (contains(n, "full") || contains(lc, "3f")) return 12.0;
    if (contains(n, "half") || contains(lc, "1f") || contains(lc, "2f")) return 9.0;
    if (contains(n, "shift change") || contains(lc, "sc")) return 9.0;
    if (contains(n, "day") || c == "S") return 8.5;
    if (contains(n, "meeting") || c == "M") return 8.0;
    return std::nullopt;
}

// ===== StoreProfile =====

bool PeakWindow::applies_on(int weekday) const {
    return weekdays.empty()
        || std::find(weekdays.begin(), weekdays.end(), weekday) != weekdays.end();
}

int StoreProfile::minimum(const std::string& station) const {
    auto it = station_minimums.find(station);
    return it == station_minimums.end() ? 0 : it->second;
}

bool StoreProfile::is_peak(const TimeRange& shift, int weekday) const {
    for (const auto& peak : peaks) {
        if (peak.applies_on(weekday) && peak.hours.overlaps(shift)) {
            return true;
        }
    }
    return false;
}

// ===== ConstraintParams =====

double ConstraintParams::weekly_cap(EmploymentClass employment) const {
    auto it = weekly_hour_caps.find(employment);
    if (it != weekly_hour_caps.end()) {
        return it->second;
    }
    return 38.0;
}

} // namespace shift_roster
