/**
 * @file model.hpp
 * @brief ロスター問題ファイル (.rst) の中間表現
 */
#ifndef SHIFT_ROSTER_RST_MODEL_HPP
#define SHIFT_ROSTER_RST_MODEL_HPP

#include "shift_roster/problem.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shift_roster {
namespace rst {

/**
 * @brief shift 宣言
 */
struct ShiftDecl {
    std::string code;
    std::string time = "TBD";
    double hours = 0.0;
    std::string name;
};

/**
 * @brief store 内の station 宣言
 */
struct StationDecl {
    std::string name;
    int64_t minimum = 0;
};

/**
 * @brief store 内の peak 宣言
 */
struct PeakDecl {
    std::string hours;              // "HH:MM - HH:MM"
    std::vector<std::string> days;  // 空なら全曜日
};

/**
 * @brief store 宣言
 */
struct StoreDecl {
    std::string name;
    double traffic = 0.0;
    std::vector<StationDecl> stations;
    std::vector<PeakDecl> peaks;
};

/**
 * @brief limits ブロック
 */
struct LimitsDecl {
    std::map<std::string, double> values;       // min_shift_hours = 3; など
    std::map<std::string, double> weekly_caps;  // weekly_cap full_time = 38;
    std::optional<std::vector<std::string>> flexible;
};

/**
 * @brief manager 宣言
 */
struct ManagerDecl {
    std::string id;
    std::string name;
};

/**
 * @brief worker 宣言
 *
 * availability[i] は (i + 1) 日目の勤務可能コード。空・"/"・"NA" は勤務不可。
 */
struct WorkerDecl {
    std::string id;
    std::string name;
    std::string employment;
    std::string station;
    std::vector<std::vector<std::string>> availability;
};

/**
 * @brief ロスター問題ファイルのモデル
 */
class Model {
public:
    Model() = default;

    /**
     * @brief 期間の開始日を設定 ("YYYY-MM-DD")
     */
    void set_start(std::string date) { start_ = std::move(date); }

    void add_shift_decl(ShiftDecl decl);
    void add_store_decl(StoreDecl decl);
    void add_holiday(std::string date);
    void add_manager_decl(ManagerDecl decl);
    void add_worker_decl(WorkerDecl decl);

    /**
     * @brief limits ブロックを取得（なければ作成）
     */
    LimitsDecl& limits();

    /**
     * @brief コアの Problem に変換
     * @param start_override 開始日の上書き（未指定なら start 宣言、それもなければ今日）
     * @throws std::runtime_error 宣言の内容が不正な場合
     */
    Problem to_problem(std::optional<Date> start_override = std::nullopt) const;

    const std::optional<std::string>& start() const { return start_; }
    const std::vector<ShiftDecl>& shift_decls() const { return shift_decls_; }
    const std::vector<StoreDecl>& store_decls() const { return store_decls_; }
    const std::vector<std::string>& holidays() const { return holidays_; }
    const std::vector<ManagerDecl>& manager_decls() const { return manager_decls_; }
    const std::vector<WorkerDecl>& worker_decls() const { return worker_decls_; }
    const std::optional<LimitsDecl>& limits_decl() const { return limits_; }

private:
    std::optional<std::string> start_;
    std::vector<ShiftDecl> shift_decls_;
    std::vector<StoreDecl> store_decls_;
    std::vector<std::string> holidays_;
    std::vector<ManagerDecl> manager_decls_;
    std::vector<WorkerDecl> worker_decls_;
    std::optional<LimitsDecl> limits_;
};

/**
 * @brief ロスター問題ファイルをパース
 * @param filename ファイル名
 * @return パースされたモデル
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Model> parse_file(const std::string& filename);

/**
 * @brief ロスター問題の文字列をパース
 * @param input 入力文字列
 * @return パースされたモデル
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Model> parse_string(const std::string& input);

} // namespace rst
} // namespace shift_roster

#endif // SHIFT_ROSTER_RST_MODEL_HPP
