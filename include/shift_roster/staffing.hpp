/**
 * @file staffing.hpp
 * @brief 店舗・日付・ステーション別の配置人数
 */
#ifndef SHIFT_ROSTER_STAFFING_HPP
#define SHIFT_ROSTER_STAFFING_HPP

#include "shift_roster/catalog.hpp"
#include "shift_roster/schedule.hpp"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace shift_roster {

/**
 * @brief 配置人数の台帳
 */
class StaffingLedger {
public:
    static StaffingLedger from_schedule(const Schedule& schedule);

    void add(const std::string& store, const Date& date, const std::string& station);

    int count(const std::string& store, const Date& date, const std::string& station) const;

    /**
     * @brief 指定日のステーション別不足人数（全店舗の合計、不足のないものは含まない）
     */
    std::map<std::string, int> deficits(const std::vector<StoreProfile>& stores,
                                        const Date& date) const;

private:
    std::map<std::tuple<std::string, Date, std::string>, int> counts_;
};

/**
 * @brief 不足しているステーションの従業員を前に並べ替える
 *
 * 安定な分割で、不足の有無が同じ従業員の相対順序は保たれる。
 */
std::vector<const Worker*> prioritize_workers(const std::vector<const Worker*>& order,
                                              const std::map<std::string, int>& deficits);

} // namespace shift_roster

#endif // SHIFT_ROSTER_STAFFING_HPP
