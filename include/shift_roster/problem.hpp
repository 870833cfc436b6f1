/**
 * @file problem.hpp
 * @brief ロスター作成問題（入力データ一式）
 */
#ifndef SHIFT_ROSTER_PROBLEM_HPP
#define SHIFT_ROSTER_PROBLEM_HPP

#include "shift_roster/calendar.hpp"
#include "shift_roster/catalog.hpp"
#include "shift_roster/worker.hpp"
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace shift_roster {

/**
 * @brief 入力データ不足（従業員なし・制約なし）
 *
 * 反復を開始する前に送出され、パイプラインを終了させる。
 */
class DataUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief マネージャー
 */
struct Manager {
    std::string id;
    std::string name;
};

/**
 * @brief ロスター作成問題
 *
 * 期間は start から kHorizonDays 日間。日番号は 1 始まり。
 */
struct Problem {
    Date start;
    std::vector<Worker> workers;
    ShiftCatalog catalog;
    std::vector<StoreProfile> stores;
    std::optional<ConstraintParams> constraints;
    std::vector<Manager> managers;
    std::set<Date> holidays;

    /**
     * @brief 日番号 (1..14) に対応する日付
     */
    Date date_of(int day) const { return start.add_days(day - 1); }

    /**
     * @brief 日付に対応する日番号（期間外なら 0）
     */
    int day_of(const Date& date) const;

    const Worker* find_worker(const std::string& id) const;
    const StoreProfile* find_store(const std::string& name) const;
    bool is_holiday(const Date& date) const { return holidays.count(date) > 0; }

    /**
     * @brief 制約パラメータを取得
     * @throws DataUnavailable 制約が与えられていない場合
     */
    const ConstraintParams& limits() const;

    /**
     * @brief 反復開始前の入力チェック
     * @throws DataUnavailable 従業員または制約がない場合
     */
    void check_ready() const;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_PROBLEM_HPP
