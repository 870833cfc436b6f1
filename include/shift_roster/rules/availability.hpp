/**
 * @file availability.hpp
 * @brief 勤務可能シフトとの整合ルール
 */
#ifndef SHIFT_ROSTER_RULES_AVAILABILITY_HPP
#define SHIFT_ROSTER_RULES_AVAILABILITY_HPP

#include "shift_roster/rule.hpp"

namespace shift_roster {

/**
 * @brief availability ルール
 *
 * - 勤務不可日への割当: critical
 * - 希望コードと異なり、どちらも柔軟コードでない: warning
 */
class AvailabilityRule : public Rule {
public:
    std::string name() const override;
    ViolationKind kind() const override { return ViolationKind::Availability; }
    void check(const Schedule& schedule, const Problem& problem,
               std::vector<Violation>& out) const override;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_RULES_AVAILABILITY_HPP
