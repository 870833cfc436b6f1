/**
 * @file schedule.hpp
 * @brief 割当とスケジュール
 */
#ifndef SHIFT_ROSTER_SCHEDULE_HPP
#define SHIFT_ROSTER_SCHEDULE_HPP

#include "shift_roster/calendar.hpp"
#include "shift_roster/worker.hpp"
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace shift_roster {

/**
 * @brief 割当の状態
 */
enum class AssignmentStatus {
    Scheduled,
    Weekend
};

std::string to_string(AssignmentStatus status);

/**
 * @brief 1人の従業員の1日分の割当
 */
struct Assignment {
    Date date;
    std::string weekday;
    std::string worker_id;
    std::string worker_name;
    EmploymentClass employment = EmploymentClass::FullTime;
    std::string shift_code;
    std::string shift_time = "TBD";
    double hours = 0.0;
    std::string store;
    std::string station;
    std::string manager_id;
    std::string manager_name;
    AssignmentStatus status = AssignmentStatus::Scheduled;
    int meal_break_minutes = 0;
    double pay_multiplier = 1.0;

    bool has_manager() const { return !manager_id.empty(); }
    double paid_hours() const { return hours * pay_multiplier; }
};

/**
 * @brief スケジュール（割当の順序付き列）
 *
 * 従業員・日付あたり高々1件の割当を保持する。
 */
class Schedule {
public:
    /**
     * @brief 割当を追加
     * @return 同じ従業員・日付の割当が既にあれば追加せず false
     */
    bool add(Assignment assignment);

    const std::vector<Assignment>& assignments() const { return assignments_; }

    /**
     * @brief 従業員・日付の割当を検索（なければ nullptr）
     */
    const Assignment* find(const std::string& worker_id, const Date& date) const;

    size_t shift_count() const { return assignments_.size(); }
    double total_hours() const;
    double paid_hours() const;
    size_t distinct_workers() const;
    bool empty() const { return assignments_.empty(); }

    /**
     * @brief タブ区切りの表として出力（ヘッダ行付き）
     */
    void write_table(std::ostream& out) const;

private:
    std::vector<Assignment> assignments_;
    std::map<std::pair<std::string, Date>, size_t> index_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_SCHEDULE_HPP
