/**
 * @file labour.hpp
 * @brief 労務ルール (shift_length, rest_period)
 */
#ifndef SHIFT_ROSTER_RULES_LABOUR_HPP
#define SHIFT_ROSTER_RULES_LABOUR_HPP

#include "shift_roster/rule.hpp"

namespace shift_roster {

/**
 * @brief shift_length ルール: min_shift_hours <= hours <= max_shift_hours
 */
class ShiftLengthRule : public Rule {
public:
    std::string name() const override;
    ViolationKind kind() const override { return ViolationKind::ShiftLength; }
    void check(const Schedule& schedule, const Problem& problem,
               std::vector<Violation>& out) const override;
};

/**
 * @brief rest_period ルール
 *
 * 従業員ごとに割当を時系列に並べ、連続する日のペアについて
 * 前シフト終了から次シフト開始までが min_rest_hours 以上であることを確認する。
 * 時刻が解析できないペアは対象外。
 */
class RestPeriodRule : public Rule {
public:
    std::string name() const override;
    ViolationKind kind() const override { return ViolationKind::RestPeriod; }
    void check(const Schedule& schedule, const Problem& problem,
               std::vector<Violation>& out) const override;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_RULES_LABOUR_HPP
