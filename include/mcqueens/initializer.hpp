/**
 * @file initializer.hpp
 * @brief 初期盤面の生成（ランダム / 貪欲）
 */
#ifndef MCQUEENS_INITIALIZER_HPP
#define MCQUEENS_INITIALIZER_HPP

#include "mcqueens/board.hpp"
#include "mcqueens/random.hpp"
#include <string>

namespace mcqueens {

/**
 * @brief 初期化戦略
 */
enum class InitStrategy {
    Random,  // 各行に独立な一様乱数の列
    Greedy   // 行順に、配置済みの行との衝突が最小の列
};

/**
 * @brief 戦略名を解析（"random" / "greedy"）
 * @throws std::invalid_argument 未知の名前
 */
InitStrategy parse_init_strategy(const std::string& name);

std::string to_string(InitStrategy strategy);

/**
 * @brief 各行に一様乱数の列を割り当てた盤面
 */
Board random_board(int n, Rng& rng);

/**
 * @brief 貪欲法による盤面
 *
 * n <= samples なら全列を候補とする（厳密な貪欲）。
 * それ以外は空き列から samples 個を一様に抽出して候補とし、全体を O(N) に保つ。
 * 最小衝突の候補が複数あれば一様に選ぶ。
 */
Board greedy_board(int n, Rng& rng, int samples);

/**
 * @brief 戦略に応じて初期盤面を生成
 */
Board initialize_board(int n, InitStrategy strategy, Rng& rng, int greedy_samples);

} // namespace mcqueens

#endif // MCQUEENS_INITIALIZER_HPP
