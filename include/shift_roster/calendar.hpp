/**
 * @file calendar.hpp
 * @brief 日付・時刻範囲のユーティリティ
 */
#ifndef SHIFT_ROSTER_CALENDAR_HPP
#define SHIFT_ROSTER_CALENDAR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace shift_roster {

/**
 * @brief 計画期間の日数
 */
constexpr int kHorizonDays = 14;

/**
 * @brief 1日の分数
 */
constexpr int kMinutesPerDay = 24 * 60;

/**
 * @brief グレゴリオ暦の日付
 *
 * 1970-01-01 からの通算日数で保持する。
 */
class Date {
public:
    Date() = default;
    Date(int year, int month, int day);

    /**
     * @brief "YYYY-MM-DD" 形式の文字列を解析
     * @return 不正な形式・存在しない日付なら std::nullopt
     */
    static std::optional<Date> parse(const std::string& text);

    /**
     * @brief 通算日数から日付を生成
     */
    static Date from_days(int64_t days);

    /**
     * @brief ローカル時刻での今日の日付
     */
    static Date today();

    int year() const;
    int month() const;
    int day() const;

    /**
     * @brief 1970-01-01 からの通算日数
     */
    int64_t days() const { return days_; }

    Date add_days(int64_t n) const { return from_days(days_ + n); }

    /**
     * @brief 曜日 (0 = 月曜 ... 6 = 日曜)
     */
    int weekday() const;

    /**
     * @brief ISO週の月曜日
     */
    Date week_start() const { return add_days(-weekday()); }

    bool is_weekend() const { return weekday() >= 5; }

    /**
     * @brief 曜日名 ("Monday" など)
     */
    std::string weekday_name() const;

    /**
     * @brief "YYYY-MM-DD" 形式の文字列
     */
    std::string to_string() const;

    bool operator==(const Date& other) const { return days_ == other.days_; }
    bool operator!=(const Date& other) const { return days_ != other.days_; }
    bool operator<(const Date& other) const { return days_ < other.days_; }
    bool operator<=(const Date& other) const { return days_ <= other.days_; }
    bool operator>(const Date& other) const { return days_ > other.days_; }
    bool operator>=(const Date& other) const { return days_ >= other.days_; }

private:
    int64_t days_ = 0;
};

/**
 * @brief 曜日番号から曜日名を取得
 * @param weekday 0 = 月曜 ... 6 = 日曜
 */
std::string weekday_name(int weekday);

/**
 * @brief 曜日名 ("Monday", "mon" など、大小文字無視) から曜日番号を取得
 */
std::optional<int> parse_weekday(const std::string& name);

/**
 * @brief 1日の中の時刻範囲（分単位）
 *
 * end <= start のとき日付をまたぐシフトとして扱う。
 */
struct TimeRange {
    int start = 0;
    int end = 0;

    bool crosses_midnight() const { return end <= start; }

    /**
     * @brief 開始日の 0:00 から見た終了時刻（分）
     */
    int end_offset() const { return crosses_midnight() ? end + kMinutesPerDay : end; }

    double duration_hours() const { return (end_offset() - start) / 60.0; }

    /**
     * @brief 2つの範囲が重なるか（日付またぎを考慮）
     */
    bool overlaps(const TimeRange& other) const;
};

/**
 * @brief "HH:MM" を 0:00 からの分数に変換
 */
std::optional<int> parse_clock(const std::string& text);

/**
 * @brief "HH:MM - HH:MM" を解析（"TBD" などは std::nullopt）
 */
std::optional<TimeRange> parse_time_range(const std::string& text);

/**
 * @brief 前シフトの終了から次シフトの開始までの休息時間
 * @return どちらかの時刻が解析できなければ std::nullopt
 */
std::optional<double> rest_hours_between(const Date& prev_date, const std::string& prev_time,
                                         const Date& next_date, const std::string& next_time);

/**
 * @brief 時間数の表示用文字列 (12 -> "12", 8.5 -> "8.5")
 */
std::string format_hours(double hours);

} // namespace shift_roster

#endif // SHIFT_ROSTER_CALENDAR_HPP
