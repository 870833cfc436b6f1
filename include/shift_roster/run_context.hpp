/**
 * @file run_context.hpp
 * @brief 1回の実行に閉じたログ・統計の置き場
 */
#ifndef SHIFT_ROSTER_RUN_CONTEXT_HPP
#define SHIFT_ROSTER_RUN_CONTEXT_HPP

#include "shift_roster/calendar.hpp"
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace shift_roster {

/**
 * @brief 割当を見送った理由
 */
enum class SkipReason {
    Blacklisted,        // 過去の反復で勤務不可日への割当と判定済み
    ProblematicShift,   // 問題ありと記録されたシフトで代替もない
    RestFlagged,        // 休息不足が記録された日
    DailyCap,           // 1日の上限超過
    WeeklyCap,          // 週の上限超過
    RestPeriod,         // 前日勤務からの休息不足
    StationCapacity     // ステーションの上限
};

std::string to_string(SkipReason reason);

/**
 * @brief 見送り記録
 */
struct SkipRecord {
    int iteration = 0;
    std::string worker_id;
    Date date;
    std::string shift_code;
    SkipReason reason = SkipReason::Blacklisted;
};

/**
 * @brief 反復ごとの統計
 */
struct IterationRecord {
    int iteration = 0;
    size_t assignments = 0;
    double hours = 0.0;
    size_t violations = 0;
    size_t critical = 0;
    size_t new_keys = 0;
    size_t skips = 0;
    double coverage_percent = 0.0;
};

/**
 * @brief 実行コンテキスト
 *
 * verbose 出力先、見送りログ、反復履歴を保持する。
 * エンジン・検証・制御・レポートへ参照で渡される。
 */
class RunContext {
public:
    RunContext() : log_(&std::cerr) {}
    explicit RunContext(std::ostream& log) : log_(&log) {}

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    /**
     * @brief 統計出力の有効/無効（反復ごとに "% Stats:" 行を出力）
     */
    void set_print_stats(bool print_stats) { print_stats_ = print_stats; }
    bool print_stats() const { return print_stats_; }

    std::ostream& log() { return *log_; }

    void record_skip(SkipRecord record);
    const std::vector<SkipRecord>& skips() const { return skips_; }

    /**
     * @brief 指定反復の見送り件数を理由別に集計
     */
    std::map<SkipReason, size_t> skip_counts(int iteration) const;

    void record_iteration(const IterationRecord& record);
    const std::vector<IterationRecord>& history() const { return history_; }

private:
    bool verbose_ = false;
    bool print_stats_ = false;
    std::ostream* log_;
    std::vector<SkipRecord> skips_;
    std::vector<IterationRecord> history_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_RUN_CONTEXT_HPP
