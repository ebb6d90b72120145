/**
 * @file validator.hpp
 * @brief 割当の独立検証（盤面の差分カウンタを使わない）
 */
#ifndef MCQUEENS_VALIDATOR_HPP
#define MCQUEENS_VALIDATOR_HPP

#include <vector>
#include <cstdint>

namespace mcqueens {

/**
 * @brief 割当が N-Queens の解か検証（O(N)）
 *
 * 列・row - col・row + col の3つの集合がそれぞれ N 個の異なる要素を持てば解。
 * 空の割当や範囲外の列は false。
 */
bool is_solution(const std::vector<int>& assignment);

/**
 * @brief 互いに攻撃し合うクイーンの組の数を一から数える（O(N)）
 * @throws std::invalid_argument 範囲外の列
 */
int64_t attacking_pairs(const std::vector<int>& assignment);

} // namespace mcqueens

#endif // MCQUEENS_VALIDATOR_HPP
