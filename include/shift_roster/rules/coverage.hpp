/**
 * @file coverage.hpp
 * @brief 配置ルール (manager_coverage, store_coverage)
 */
#ifndef SHIFT_ROSTER_RULES_COVERAGE_HPP
#define SHIFT_ROSTER_RULES_COVERAGE_HPP

#include "shift_roster/rule.hpp"

namespace shift_roster {

/**
 * @brief manager_coverage ルール
 *
 * (日付, シフト時刻) ごとにまとめ、マネージャー付きの割当が1件もない
 * グループを critical とする。
 */
class ManagerCoverageRule : public Rule {
public:
    std::string name() const override;
    ViolationKind kind() const override { return ViolationKind::ManagerCoverage; }
    void check(const Schedule& schedule, const Problem& problem,
               std::vector<Violation>& out) const override;
};

/**
 * @brief store_coverage ルール
 *
 * 割当のある (店舗, 日付) で、最低人数 1 以上のステーションに
 * 誰もいなければ warning とする。
 */
class StoreCoverageRule : public Rule {
public:
    std::string name() const override;
    ViolationKind kind() const override { return ViolationKind::StoreCoverage; }
    void check(const Schedule& schedule, const Problem& problem,
               std::vector<Violation>& out) const override;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_RULES_COVERAGE_HPP
