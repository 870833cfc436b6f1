/**
 * @file violation.hpp
 * @brief 検証で検出される違反
 */
#ifndef SHIFT_ROSTER_VIOLATION_HPP
#define SHIFT_ROSTER_VIOLATION_HPP

#include "shift_roster/calendar.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace shift_roster {

/**
 * @brief 違反の種類
 *
 * 並びは ViolationDetail の候補型の並びと一致させる。
 */
enum class ViolationKind {
    Availability,
    ManagerCoverage,
    ShiftLength,
    RestPeriod,
    StoreCoverage
};

enum class Severity {
    Critical,
    Warning
};

enum class LengthBound {
    Under,
    Over
};

std::string to_string(ViolationKind kind);
std::string to_string(Severity severity);

/**
 * @brief 勤務可能シフトとの不一致
 *
 * requested が空なら勤務不可日への割当。
 */
struct AvailabilityDetail {
    std::optional<std::string> requested;
    std::string assigned;
};

/**
 * @brief マネージャー不在のシフト帯
 */
struct ManagerCoverageDetail {
    std::string shift_time;
    size_t group_size = 0;
};

/**
 * @brief 勤務時間が上下限の外
 */
struct ShiftLengthDetail {
    double observed = 0.0;
    double bound = 0.0;
    LengthBound side = LengthBound::Under;
};

/**
 * @brief 勤務間の休息不足
 */
struct RestPeriodDetail {
    double observed = 0.0;
    double required = 0.0;
    Date previous_date;
};

/**
 * @brief 店舗のステーション欠員
 */
struct StoreCoverageDetail {
    std::string store;
    std::vector<std::string> missing_stations;
};

using ViolationDetail = std::variant<AvailabilityDetail, ManagerCoverageDetail,
                                     ShiftLengthDetail, RestPeriodDetail,
                                     StoreCoverageDetail>;

/**
 * @brief 違反
 *
 * 店舗・シフト帯単位の違反では worker_id は空。
 */
struct Violation {
    Severity severity = Severity::Critical;
    std::string worker_id;
    std::string worker_name;
    Date date;
    std::string shift_code;
    std::string message;
    std::string recommendation;
    ViolationDetail detail;

    ViolationKind kind() const { return static_cast<ViolationKind>(detail.index()); }
    bool is_critical() const { return severity == Severity::Critical; }
};

/**
 * @brief 違反の重複排除キー (worker, date, kind, shift code)
 */
struct ViolationKey {
    std::string worker_id;
    Date date;
    ViolationKind kind = ViolationKind::Availability;
    std::string shift_code;

    bool operator<(const ViolationKey& other) const;
    bool operator==(const ViolationKey& other) const;
};

ViolationKey key_of(const Violation& violation);

/**
 * @brief 1行形式で出力 ("[critical] rest_period 2025-01-07 W001 E: ...")
 */
std::ostream& operator<<(std::ostream& os, const Violation& violation);

/**
 * @brief 重大度別の件数
 */
size_t count_critical(const std::vector<Violation>& violations);

} // namespace shift_roster

#endif // SHIFT_ROSTER_VIOLATION_HPP
