/**
 * @file reporter.hpp
 * @brief 最終カバレッジレポート
 */
#ifndef SHIFT_ROSTER_REPORTER_HPP
#define SHIFT_ROSTER_REPORTER_HPP

#include "shift_roster/problem.hpp"
#include "shift_roster/run_context.hpp"
#include "shift_roster/schedule.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace shift_roster {

/**
 * @brief 勤務可能枠の充足状態
 */
enum class SlotStatus {
    Filled,     // 希望どおり（または柔軟コード）で割当済み
    Unfilled,   // 割当なし
    Mismatch    // 希望と異なるコードで割当
};

enum class StaffingStatus {
    Met,
    Understaffed
};

enum class RosterStatus {
    Approved,
    NeedsReview
};

std::string to_string(SlotStatus status);
std::string to_string(StaffingStatus status);
std::string to_string(RosterStatus status);

/**
 * @brief 勤務可能枠1件の確認結果
 */
struct AvailabilityCheck {
    std::string worker_id;
    std::string worker_name;
    Date date;
    std::string available_shift;
    std::string assigned_shift;   // 割当なしなら空
    SlotStatus status = SlotStatus::Unfilled;
};

/**
 * @brief (店舗, 日付, ステーション) の配置確認結果
 */
struct StaffingCheck {
    std::string store;
    Date date;
    std::string station;
    int required = 0;
    int assigned = 0;
    StaffingStatus status = StaffingStatus::Met;
    std::string details;
};

/**
 * @brief 最終カバレッジレポート
 */
struct CoverageReport {
    RosterStatus status = RosterStatus::NeedsReview;
    size_t total_slots = 0;
    size_t filled = 0;
    size_t unfilled = 0;
    size_t mismatched = 0;
    double coverage_percent = 0.0;
    std::vector<AvailabilityCheck> availability_checks;
    std::vector<StaffingCheck> staffing_checks;
    std::string summary;
    std::vector<std::string> recommendations;

    size_t understaffed_count() const;
    size_t met_count() const;
    bool approved() const { return status == RosterStatus::Approved; }
};

/**
 * @brief レポート作成
 *
 * ループ終了後に1回だけ、勤務可能マトリクス全体と店舗配置を監査する。
 */
class CoverageReporter {
public:
    CoverageReporter(const Problem& problem, RunContext& context);

    CoverageReport build(const Schedule& schedule) const;

    /**
     * @brief 全従業員・全日の勤務可能枠を確認
     */
    std::vector<AvailabilityCheck> check_availability(const Schedule& schedule) const;

    /**
     * @brief 全店舗・全日・宣言済み全ステーションの配置を確認
     */
    std::vector<StaffingCheck> check_staffing(const Schedule& schedule) const;

    /**
     * @brief 勤務可能枠の充足率 (%)（枠がなければ 0）
     */
    double coverage_percent(const Schedule& schedule) const;

    /**
     * @brief 人が読む形式で出力
     */
    void render(const CoverageReport& report, std::ostream& out) const;

private:
    bool slot_filled(const std::string& available, const std::string& assigned,
                     const Worker& worker, int day) const;

    const Problem& problem_;
    RunContext& context_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_REPORTER_HPP
