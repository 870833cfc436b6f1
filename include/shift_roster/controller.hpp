/**
 * @file controller.hpp
 * @brief 生成・検証・修復ループの制御
 */
#ifndef SHIFT_ROSTER_CONTROLLER_HPP
#define SHIFT_ROSTER_CONTROLLER_HPP

#include "shift_roster/engine.hpp"
#include "shift_roster/iteration_memory.hpp"
#include "shift_roster/problem.hpp"
#include "shift_roster/reporter.hpp"
#include "shift_roster/run_context.hpp"
#include "shift_roster/validator.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace shift_roster {

/**
 * @brief 制御の状態
 */
enum class ControllerState {
    Generate,
    Validate,
    Loop,
    Finalize
};

std::string to_string(ControllerState state);

/**
 * @brief 反復制御のオプション
 */
struct ControllerOptions {
    int max_iterations = 5;
    uint32_t base_seed = kDefaultBaseSeed;

    // 早期終了: 反復 early_stop_min_iteration 回以上、充足率・違反数が基準内
    bool early_stop = false;
    int early_stop_min_iteration = 3;
    double early_stop_coverage = 90.0;
    size_t early_stop_max_violations = 10;
};

/**
 * @brief 反復ごとのコールバック関数型
 *
 * 引数は反復番号（0 始まり）、生成されたスケジュール、その検証結果。
 */
using IterationCallback = std::function<void(int, const Schedule&, const std::vector<Violation>&)>;

/**
 * @brief 1回の実行結果
 */
struct RunResult {
    Schedule schedule;
    std::vector<Violation> violations;                       // 最終スケジュールの違反
    std::vector<std::vector<Violation>> iteration_violations;
    IterationMemory memory;
    std::vector<Manager> managers;
    int iterations = 0;
    bool converged = false;       // 違反 0 で終了
    bool stopped_early = false;   // 早期終了条件で終了
    CoverageReport report;
};

/**
 * @brief 反復制御
 *
 * GENERATE -> VALIDATE -> {LOOP -> GENERATE | FINALIZE} の状態機械。
 * 違反が 0 になるか反復回数が上限に達したら FINALIZE。それ以外は
 * 新しい違反を記憶に取り込んで再生成する。入力は実行ごとに複製され、
 * マネージャーが宣言されていなければ候補を生成して補う。
 */
class IterationController {
public:
    /**
     * @throws DataUnavailable 従業員または制約がない場合
     */
    IterationController(const Problem& problem, RunContext& context,
                        ControllerOptions options = ControllerOptions());

    /**
     * @brief ループを実行して最終結果を返す
     */
    RunResult run();

    void set_iteration_callback(IterationCallback callback) { callback_ = std::move(callback); }

    ControllerState state() const { return state_; }
    const Problem& problem() const { return problem_; }
    const ControllerOptions& options() const { return options_; }

private:
    bool should_stop_early(int iteration, double coverage, size_t violation_count) const;

    Problem problem_;
    RunContext& context_;
    ControllerOptions options_;
    IterationCallback callback_;
    ControllerState state_ = ControllerState::Generate;
};

} // namespace shift_roster

#endif // SHIFT_ROSTER_CONTROLLER_HPP
