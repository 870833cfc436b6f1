/**
 * @file managers.hpp
 * @brief マネージャー候補の生成と店舗・日付ごとの割当
 */
#ifndef SHIFT_ROSTER_MANAGERS_HPP
#define SHIFT_ROSTER_MANAGERS_HPP

#include "shift_roster/problem.hpp"
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace shift_roster {

/**
 * @brief 従業員数から既定のマネージャー数を決める (max(20, n / 2))
 */
size_t default_manager_count(size_t worker_count);

/**
 * @brief 固定の姓名リストから重複しないマネージャーを生成
 *
 * 同じ seed なら同じ結果になる。
 */
std::vector<Manager> generate_managers(size_t count, uint32_t seed);

/**
 * @brief 店舗・日付ごとのマネージャー割当
 *
 * 店舗・日付あたりの異なるマネージャー数を上限以下に保ち、
 * 上限に達したら既に割り当てたマネージャーを再利用する。
 */
class ManagerRoster {
public:
    ManagerRoster(const std::vector<Manager>& pool, size_t max_per_store_day);

    /**
     * @brief マネージャーを1人選ぶ（候補がいなければ nullptr）
     */
    const Manager* assign(const std::string& store, const Date& date, std::mt19937& rng);

    size_t distinct_count(const std::string& store, const Date& date) const;

private:
    const std::vector<Manager>& pool_;
    size_t max_per_store_day_;
    std::map<std::pair<std::string, Date>, std::vector<size_t>> used_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_MANAGERS_HPP
