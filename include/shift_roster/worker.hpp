/**
 * @file worker.hpp
 * @brief 従業員と勤務可能シフトの定義
 */
#ifndef SHIFT_ROSTER_WORKER_HPP
#define SHIFT_ROSTER_WORKER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shift_roster {

/**
 * @brief 雇用区分
 */
enum class EmploymentClass {
    FullTime,
    PartTime,
    Casual
};

/**
 * @brief 表示名 ("Full-Time" など)
 */
std::string to_string(EmploymentClass employment);

/**
 * @brief 雇用区分の解析
 *
 * "full_time", "Full-Time", "fulltime", "ft" のような表記を受け付ける。
 */
std::optional<EmploymentClass> parse_employment_class(const std::string& text);

/**
 * @brief 勤務不可を表すコードか ("", "/", "NA")
 */
bool is_unavailable_code(const std::string& code);

/**
 * @brief 従業員
 *
 * availability は計画期間の日番号 (1..14) から勤務可能なシフトコードへの
 * 写像。先頭のコードが希望シフトで、残りは代替として受け入れ可能なコード。
 * 勤務不可の日はエントリを持たない。
 */
struct Worker {
    std::string id;
    std::string name;
    EmploymentClass employment = EmploymentClass::FullTime;
    std::string station;
    std::map<int, std::vector<std::string>> availability;

    /**
     * @brief 指定日の勤務可能コードを設定
     *
     * 勤務不可コードは取り除かれ、有効なコードが残らなければエントリを削除する。
     */
    void set_availability(int day, const std::vector<std::string>& codes);

    /**
     * @brief 指定日の希望シフトコード（勤務不可なら std::nullopt）
     */
    std::optional<std::string> requested_code(int day) const;

    /**
     * @brief 指定日の勤務可能コード一覧（勤務不可なら空）
     */
    const std::vector<std::string>& codes_on(int day) const;

    /**
     * @brief 指定日に code で勤務可能か
     */
    bool offers(int day, const std::string& code) const;

    bool is_available(int day) const { return availability.count(day) > 0; }
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_WORKER_HPP
