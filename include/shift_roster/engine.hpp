/**
 * @file engine.hpp
 * @brief 割当エンジン（日ごと・従業員ごとの貪欲割当）
 */
#ifndef SHIFT_ROSTER_ENGINE_HPP
#define SHIFT_ROSTER_ENGINE_HPP

#include "shift_roster/iteration_memory.hpp"
#include "shift_roster/managers.hpp"
#include "shift_roster/problem.hpp"
#include "shift_roster/run_context.hpp"
#include "shift_roster/schedule.hpp"
#include "shift_roster/staffing.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace shift_roster {

/**
 * @brief 問題ありシフトを代替なしで見送り始める反復
 */
constexpr int kEscalationIteration = 4;

/**
 * @brief 休息不足が記録された日を見送り始める反復
 */
constexpr int kRestMemoryIteration = 3;

/**
 * @brief ステーション上限 = 最低人数 × この係数
 */
constexpr int kStationCeilingFactor = 3;

/**
 * @brief 最低人数 0 のステーションの上限
 */
constexpr int kOptionalStationCeiling = 10;

constexpr uint32_t kDefaultBaseSeed = 42;

/**
 * @brief 反復ごとの休息時間しきい値
 *
 * 反復 0 で statutory - 3 時間から始まり、反復 5 以降で statutory に達する。
 * 反復に対して単調非減少。
 */
double rest_threshold(int iteration, double statutory_minimum);

/**
 * @brief 反復番号から乱数シードを決める
 */
uint32_t seed_for_iteration(uint32_t base_seed, int iteration);

/**
 * @brief エンジン統計情報（直近の generate 1回分）
 */
struct EngineStats {
    size_t candidates = 0;      // 勤務可能だった (worker, date) の数
    size_t assigned = 0;
    size_t skipped = 0;
    size_t substitutions = 0;   // 記憶された代替コードを使った数
    size_t clamped = 0;         // 勤務時間を上下限に合わせた数
};

/**
 * @brief 割当エンジン
 *
 * 計画期間の各日について、不足ステーションの従業員を優先しながら
 * 従業員を1人ずつ処理し、勤務可能シフト・労務上限・過去の違反記憶に
 * 従って割当を作る。割当できない候補は理由付きで見送りログに記録する。
 */
class AssignmentEngine {
public:
    /**
     * @throws DataUnavailable 制約パラメータがない場合
     */
    AssignmentEngine(const Problem& problem, RunContext& context);

    void set_base_seed(uint32_t seed) { base_seed_ = seed; }
    uint32_t base_seed() const { return base_seed_; }

    /**
     * @brief スケジュールを生成
     * @param memory これまでの反復で記録された違反
     * @param iteration 反復番号（0 始まり）
     */
    Schedule generate(const IterationMemory& memory, int iteration);

    const EngineStats& stats() const { return stats_; }

private:
    std::optional<std::string> choose_code(const Worker& worker, int day, const Date& date,
                                           const IterationMemory& memory);
    double resolve_hours(const Worker& worker, const Date& date, const std::string& code,
                         const IterationMemory& memory);
    const StoreProfile* choose_store(const Worker& worker, const std::optional<TimeRange>& shift,
                                     const Date& date);
    bool station_has_room(const StoreProfile& store, const Date& date,
                          const std::string& station) const;
    double pay_multiplier(const Date& date) const;
    void skip(const Worker& worker, const Date& date, const std::string& code, SkipReason reason);

    const Problem& problem_;
    const ConstraintParams& limits_;
    RunContext& context_;
    uint32_t base_seed_ = kDefaultBaseSeed;

    // generate 1回分の状態
    int iteration_ = 0;
    std::mt19937 rng_;
    StaffingLedger staffing_;
    std::map<std::pair<std::string, Date>, double> daily_hours_;
    std::map<std::pair<std::string, Date>, double> weekly_hours_;  // キーは週の月曜日
    EngineStats stats_;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_ENGINE_HPP
