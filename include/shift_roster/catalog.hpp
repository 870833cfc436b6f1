/**
 * @file catalog.hpp
 * @brief シフト定義・店舗プロファイル・制約パラメータ
 */
#ifndef SHIFT_ROSTER_CATALOG_HPP
#define SHIFT_ROSTER_CATALOG_HPP

#include "shift_roster/calendar.hpp"
#include "shift_roster/worker.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace shift_roster {

/**
 * @brief シフトコードの定義
 */
struct ShiftDefinition {
    std::string code;
    std::string time = "TBD";   // "HH:MM - HH:MM"
    double hours = 0.0;
    std::string name;

    std::optional<TimeRange> time_range() const { return parse_time_range(time); }
};

/**
 * @brief シフトコード表
 */
class ShiftCatalog {
public:
    /**
     * @brief シフト定義を追加
     * @return 同じコードが既に登録されていれば false
     */
    bool add(ShiftDefinition def);

    /**
     * @brief コードからシフト定義を検索（見つからなければ nullptr）
     */
    const ShiftDefinition* find(const std::string& code) const;

    /**
     * @brief シフトの時刻範囲文字列（未知のコードは "TBD"）
     */
    std::string time_of(const std::string& code) const;

    /**
     * @brief シフトの勤務時間を解決
     *
     * 登録された時間が正ならそれを返す。0 や未登録の場合はコードと名称から
     * 推定し、推定できなければ fallback を返す。
     */
    double resolve_hours(const std::string& code, double fallback) const;

    const std::map<std::string, ShiftDefinition>& definitions() const { return shifts_; }
    size_t size() const { return shifts_.size(); }
    bool empty() const { return shifts_.empty(); }

private:
    std::map<std::string, ShiftDefinition> shifts_;
};

/**
 * @brief コード・名称からの勤務時間推定
 * @return 推定できなければ std::nullopt
 */
std::optional<double> infer_shift_hours(const std::string& code, const std::string& name);

/**
 * @brief ピーク時間帯
 *
 * weekdays が空なら全曜日に適用する。
 */
struct PeakWindow {
    TimeRange hours;
    std::vector<int> weekdays;

    bool applies_on(int weekday) const;
};

/**
 * @brief 店舗プロファイル
 */
struct StoreProfile {
    std::string name;
    std::map<std::string, int> station_minimums;
    double traffic = 0.0;
    std::vector<PeakWindow> peaks;

    /**
     * @brief ステーションの最低人数（未宣言なら 0）
     */
    int minimum(const std::string& station) const;

    /**
     * @brief 最低人数が 1 以上のステーションか
     */
    bool requires_station(const std::string& station) const { return minimum(station) > 0; }

    /**
     * @brief シフト時間帯がピークと重なるか
     */
    bool is_peak(const TimeRange& shift, int weekday) const;
};

/**
 * @brief 労務・運用上の制約パラメータ
 */
struct ConstraintParams {
    double min_shift_hours = 3.0;
    double max_shift_hours = 12.0;
    double min_rest_hours = 10.0;
    double daily_hour_cap = 12.0;
    std::map<EmploymentClass, double> weekly_hour_caps = {
        {EmploymentClass::FullTime, 38.0},
        {EmploymentClass::PartTime, 30.0},
        {EmploymentClass::Casual, 40.0},
    };
    size_t max_managers_per_store_day = 10;
    std::set<std::string> flexible_codes = {"1F", "2F", "3F"};

    // 食事休憩
    double meal_break_threshold_hours = 5.0;
    int meal_break_minutes = 30;

    // 割増率
    double saturday_rate = 1.25;
    double sunday_rate = 1.5;
    double holiday_rate = 2.25;

    double weekly_cap(EmploymentClass employment) const;
    bool is_flexible(const std::string& code) const { return flexible_codes.count(code) > 0; }
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_CATALOG_HPP
