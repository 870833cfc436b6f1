/**
 * @file rule.hpp
 * @brief 検証ルール基底クラスと全ルールヘッダのインクルード
 */
#ifndef SHIFT_ROSTER_RULE_HPP
#define SHIFT_ROSTER_RULE_HPP

#include "shift_roster/problem.hpp"
#include "shift_roster/schedule.hpp"
#include "shift_roster/violation.hpp"
#include <memory>
#include <string>
#include <vector>

namespace shift_roster {

/**
 * @brief 検証ルールの基底クラス
 *
 * 完成したスケジュールを走査し、検出した違反を out に追加する。
 * check() は副作用を持たず、同じ入力には同じ違反列を返す。
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief ルールの名前を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief ルールが検出する違反の種類
     */
    virtual ViolationKind kind() const = 0;

    /**
     * @brief スケジュールを検証
     * @param schedule 検証対象
     * @param problem 入力データ（制約パラメータを含む）
     * @param out 検出した違反の追加先
     */
    virtual void check(const Schedule& schedule, const Problem& problem,
                       std::vector<Violation>& out) const = 0;
};

using RulePtr = std::shared_ptr<Rule>;

} // namespace shift_roster

// 各ルールグループのヘッダをインクルード
#include "shift_roster/rules/availability.hpp"
#include "shift_roster/rules/labour.hpp"
#include "shift_roster/rules/coverage.hpp"

#endif // SHIFT_ROSTER_RULE_HPP
