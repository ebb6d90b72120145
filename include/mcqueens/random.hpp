/**
 * @file random.hpp
 * @brief 乱数生成器の型と選択ヘルパー
 */
#ifndef MCQUEENS_RANDOM_HPP
#define MCQUEENS_RANDOM_HPP

#include <random>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace mcqueens {

/**
 * @brief 求解1回につき1つ生成し、初期化と修復ループに参照で渡す
 */
using Rng = std::mt19937_64;

/**
 * @brief [0, n) の一様乱数（n > 0）
 */
inline size_t uniform_index(Rng& rng, size_t n) {
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(rng);
}

/**
 * @brief 候補から一様に1つ選ぶ（候補は空でないこと）
 */
inline int pick_uniform(const std::vector<int>& candidates, Rng& rng) {
    return candidates[uniform_index(rng, candidates.size())];
}

} // namespace mcqueens

#endif // MCQUEENS_RANDOM_HPP
