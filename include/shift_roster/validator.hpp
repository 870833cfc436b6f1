/**
 * @file validator.hpp
 * @brief スケジュール検証器
 */
#ifndef SHIFT_ROSTER_VALIDATOR_HPP
#define SHIFT_ROSTER_VALIDATOR_HPP

#include "shift_roster/rule.hpp"
#include "shift_roster/run_context.hpp"
#include <vector>

namespace shift_roster {

/**
 * @brief 検証器
 *
 * 登録順にルールを適用し、違反をその順で返す。既定のルールは
 * availability, manager_coverage, shift_length, rest_period, store_coverage。
 */
class Validator {
public:
    Validator();
    explicit Validator(std::vector<RulePtr> rules);

    /**
     * @brief スケジュールを検証
     * @throws DataUnavailable 制約パラメータがない場合
     */
    std::vector<Violation> validate(const Schedule& schedule, const Problem& problem) const;

    /**
     * @brief スケジュールを検証し、verbose 時はルール別の件数をログに出す
     */
    std::vector<Violation> validate(const Schedule& schedule, const Problem& problem,
                                    RunContext& context) const;

    const std::vector<RulePtr>& rules() const { return rules_; }

private:
    std::vector<RulePtr> rules_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_VALIDATOR_HPP
