#include "shift_roster/worker.hpp"
#include <algorithm>
#include <cctype>

namespace shift_roster {

namespace {

const std::vector<std::string> kNoCodes;

std::string trimmed(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string to_string(EmploymentClass employment) {
    switch (employment) {
        case EmploymentClass::FullTime: return "Full-Time";
        case EmploymentClass::PartTime: return "Part-Time";
        case EmploymentClass::Casual:   return "Casual";
    }
    return "Unknown";
}

std::optional<EmploymentClass> parse_employment_class(const std::string& text) {
    // 区切り文字を除いて小文字化
    std::string key;
    for (char c : text) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key == "fulltime" || key == "ft" || key == "full") {
        return EmploymentClass::FullTime;
    }
    if (key == "parttime" || key == "pt" || key == "part") {
        return EmploymentClass::PartTime;
    }
    if (key == "casual" || key == "cas") {
        return EmploymentClass::Casual;
    }
    return std::nullopt;
}

bool is_unavailable_code(const std::string& code) {
    std::string s = trimmed(code);
    return s.empty() || s == "/" || s == "NA" || s == "N/A";
}

void Worker::set_availability(int day, const std::vector<std::string>& codes) {
    std::vector<std::string> kept;
    for (const auto& code : codes) {
        if (is_unavailable_code(code)) continue;
        std::string c = trimmed(code);
        if (std::find(kept.begin(), kept.end(), c) == kept.end()) {
            kept.push_back(c);
        }
    }
    if (kept.empty()) {
        availability.erase(day);
    } else {
        availability[day] = std::move(kept);
    }
}

std::optional<std::string> Worker::requested_code(int day) const {
    auto it = availability.find(day);
    if (it == availability.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

const std::vector<std::string>& Worker::codes_on(int day) const {
    auto it = availability.find(day);
    if (it == availability.end()) {
        return kNoCodes;
    }
    return it->second;
}

bool Worker::offers(int day, const std::string& code) const {
    const auto& codes = codes_on(day);
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

} // namespace shift_roster
