/**
 * @file restart.hpp
 * @brief シードを変えた独立試行（ランダムリスタート）
 */
#ifndef MCQUEENS_RESTART_HPP
#define MCQUEENS_RESTART_HPP

#include "mcqueens/solver.hpp"

namespace mcqueens {

constexpr uint64_t kDefaultRestartSeed = 42;

/**
 * @brief リスタート結果
 */
struct RestartResult {
    SolveResult best;        // 最少ステップで成功した試行（全て失敗なら失敗結果）
    SolverStats best_stats;  // best の試行の統計（全て失敗なら最後の試行）
    int attempt = -1;        // 1始まり、全て失敗なら -1
    int attempts_run = 0;
};

/**
 * @brief シード seed0, seed0 + 1, ... で attempts 回解き、最少ステップの成功を返す
 *
 * 各試行は独立した盤面を使う。seed0 はリクエストのシード（なければ kDefaultRestartSeed）。
 * solver が停止されたら残りの試行を打ち切る。
 *
 * @throws std::invalid_argument attempts <= 0、またはリクエストが不正
 */
RestartResult solve_with_restarts(Solver& solver, const SolveRequest& request, int attempts);

} // namespace mcqueens

#endif // MCQUEENS_RESTART_HPP
