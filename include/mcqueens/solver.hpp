/**
 * @file solver.hpp
 * @brief MIN-CONFLICTS ソルバー（貪欲初期化、空き列優先の修復ループ）
 */
#ifndef MCQUEENS_SOLVER_HPP
#define MCQUEENS_SOLVER_HPP

#include "mcqueens/board.hpp"
#include "mcqueens/initializer.hpp"
#include "mcqueens/random.hpp"
#include <atomic>
#include <optional>
#include <vector>
#include <cstdint>

namespace mcqueens {

constexpr int64_t kDefaultMaxSteps = 100000;

/**
 * @brief 求解リクエスト
 */
struct SolveRequest {
    int n = 0;
    int64_t max_steps = kDefaultMaxSteps;
    std::optional<uint64_t> seed;  // なければ std::random_device
};

/**
 * @brief 求解結果
 *
 * 失敗（ステップ上限到達）はエラーではなく通常の結果。
 * 失敗時は assignment を持たず、steps_taken == max_steps（stop() による中断を除く）。
 */
struct SolveResult {
    std::optional<std::vector<int>> assignment;
    int64_t steps_taken = 0;
    bool succeeded = false;
};

/**
 * @brief ソルバー設定
 */
struct SolverConfig {
    InitStrategy init_strategy = InitStrategy::Greedy;
    int greedy_samples = 50;
    // 0: 全列を評価（厳密）、>0: 現在列 + 空き列 column_samples 個 + ランダム列 column_samples/2 個
    int column_samples = 0;
    // 成功時に独立検証器で再確認する
    bool verify = true;
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t init_conflicted_rows = 0;
    int64_t init_total_conflicts = 0;
    int64_t steps = 0;
    int64_t moves = 0;
    int64_t noop_steps = 0;
    int64_t full_scans = 0;
    int64_t free_column_hits = 0;
};

/**
 * @brief MIN-CONFLICTS ソルバー
 *
 * 各ステップで衝突行を一様に1つ選び、衝突数最小の列（同点は一様に選択）へ移動する。
 * 盤面は solve() の間このインスタンスが専有する。並列に解く場合は Solver を分けること。
 */
class Solver {
public:
    Solver();
    explicit Solver(SolverConfig config);

    /**
     * @brief 求解
     * @throws std::invalid_argument n <= 0 または max_steps <= 0
     * @throws std::logic_error 成功判定と独立検証が食い違った（差分更新のバグ）
     */
    SolveResult solve(const SolveRequest& request);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    const SolverConfig& config() const { return config_; }

    void set_init_strategy(InitStrategy strategy) { config_.init_strategy = strategy; }

    /**
     * @brief 貪欲初期化で1行あたりに評価する列数
     */
    void set_greedy_samples(int samples) { config_.greedy_samples = samples; }

    /**
     * @brief 修復ステップの列サンプリング数（0 で厳密な全列評価）
     */
    void set_column_samples(int samples) { config_.column_samples = samples; }

    void set_verify(bool enabled) { config_.verify = enabled; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 行 row のクイーンを移す列を選ぶ（修復1ステップ分）
     *
     * column_samples が 0 か N 以上なら全列の最小、それ以外はサンプリングした候補の最小。
     * 最小の列が複数あれば一様に選ぶ。盤面は変更しない。
     */
    int choose_column(const Board& board, int row, Rng& rng);

private:
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    void validate(const SolveRequest& request) const;

    /**
     * @brief 修復ループ本体
     */
    SolveResult repair(Board& board, int64_t max_steps, Rng& rng);

    /**
     * @brief 1ステップ（衝突行の選択、列の選択、移動）
     */
    void step(Board& board, Rng& rng);

    /**
     * @brief 衝突数最小の列を選ぶ（空き列を先に調べる）
     */
    int select_column(const Board& board, int row, Rng& rng);

    /**
     * @brief サンプリングした候補列から選ぶ（近似）
     */
    int select_column_sampled(const Board& board, int row, Rng& rng);

    SolverConfig config_;
    SolverStats stats_;

    // 候補列バッファ（ヒープ確保を避けるため再利用）
    std::vector<int> candidates_;

    // サンプリング時の重複除去（列ごとに最後に調べた呼び出しの番号）
    std::vector<uint32_t> seen_;
    uint32_t stamp_ = 0;
};

} // namespace mcqueens

#endif // MCQUEENS_SOLVER_HPP
