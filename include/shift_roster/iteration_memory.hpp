/**
 * @file iteration_memory.hpp
 * @brief 反復間で引き継ぐ違反の記憶
 */
#ifndef SHIFT_ROSTER_ITERATION_MEMORY_HPP
#define SHIFT_ROSTER_ITERATION_MEMORY_HPP

#include "shift_roster/violation.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace shift_roster {

/**
 * @brief 勤務時間違反の記録
 */
struct LengthIssue {
    double observed = 0.0;
    double bound = 0.0;
    LengthBound side = LengthBound::Under;
};

/**
 * @brief 反復間の違反記憶
 *
 * ソルバーの NoGood 学習と同様に、失敗パターンを記録して次の生成で
 * 同じ割当を避ける。違反は (worker, date, kind, shift code) で重複排除され、
 * 一度記録されたものは実行中に消えない。
 */
class IterationMemory {
public:
    /**
     * @brief 違反を取り込む
     * @return 新しく記録されたキーの数
     */
    size_t merge(const std::vector<Violation>& violations);

    /**
     * @brief 未記録のキーの数（記憶は変更しない）
     */
    size_t count_new(const std::vector<Violation>& violations) const;

    bool contains(const ViolationKey& key) const { return keys_.count(key) > 0; }

    /**
     * @brief 勤務不可日への割当と判定された (worker, date) か
     */
    bool is_blacklisted(const std::string& worker_id, const Date& date) const;

    /**
     * @brief 記録された希望コード（勤務可能シフトとの不一致から学習）
     */
    std::optional<std::string> preferred_code(const std::string& worker_id, const Date& date) const;

    /**
     * @brief 問題ありと記録された (worker, date, shift) か
     */
    bool is_problematic(const std::string& worker_id, const Date& date,
                        const std::string& shift_code) const;

    /**
     * @brief 休息不足が記録された日か
     */
    bool is_rest_flagged(const std::string& worker_id, const Date& date) const;

    std::optional<LengthIssue> length_issue(const std::string& worker_id, const Date& date) const;

    /**
     * @brief これまでに記録された全違反（初出順）
     */
    const std::vector<Violation>& accumulated() const { return accumulated_; }

    size_t size() const { return keys_.size(); }
    size_t blacklist_size() const { return blacklist_.size(); }
    size_t problematic_size() const { return problematic_.size(); }

private:
    using WorkerDay = std::pair<std::string, Date>;

    void learn(const Violation& violation);

    std::set<ViolationKey> keys_;
    std::vector<Violation> accumulated_;

    std::set<WorkerDay> blacklist_;
    std::map<WorkerDay, std::string> preferences_;
    std::set<std::tuple<std::string, Date, std::string>> problematic_;
    std::map<std::string, std::set<Date>> rest_flags_;
    std::map<WorkerDay, LengthIssue> length_issues_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_ITERATION_MEMORY_HPP
