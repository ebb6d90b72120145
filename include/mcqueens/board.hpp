/**
 * @file board.hpp
 * @brief N-Queens の盤面（割当と列・対角線の占有カウンタ）
 */
#ifndef MCQUEENS_BOARD_HPP
#define MCQUEENS_BOARD_HPP

#include "mcqueens/sparse_set.hpp"
#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>

namespace mcqueens {

/**
 * @brief 盤面状態
 *
 * assignment[row] = col の形で各行に1つのクイーンを持つ（行の重複は表現上起こらない）。
 * 列・主対角線（row - col + N - 1）・副対角線（row + col）ごとに
 * クイーン数と行番号の XOR を保持し、衝突数の問い合わせと移動を O(1) で行う。
 *
 * 衝突行の集合は移動のたびに差分更新する。ある線のクイーン数がちょうど1のとき、
 * その線の XOR は唯一のクイーンの行番号に等しい。2 -> 1 / 1 -> 2 の遷移でだけ
 * 他の行の衝突状態が変わりうるので、その行だけを再評価すればよい。
 */
class Board {
public:
    static constexpr int kUnplaced = -1;

    /**
     * @brief 空の盤面（クイーン未配置、全カウンタ0）
     * @throws std::invalid_argument n <= 0
     */
    explicit Board(int n);

    /**
     * @brief 完全な割当から盤面を構築（O(N)）
     * @throws std::invalid_argument 空、または列が [0, N) の範囲外
     */
    explicit Board(const std::vector<int>& assignment);

    int size() const { return n_; }

    /**
     * @brief 未配置の行にクイーンを置く（初期化専用）
     * @throws std::invalid_argument row または col が [0, N) の範囲外
     * @throws std::logic_error 既に配置済みの行
     */
    void place(int row, int col);

    /**
     * @brief 行 row のクイーンを列 col に置いた場合に攻撃してくる他のクイーン数
     *
     * col が現在の列なら自分自身の寄与（各線 1）を差し引く。
     * 現在の列と異なる列の線には自分は乗っていないので差し引かない。
     */
    int conflict_count(int row, int col) const {
        int self = (assignment_[static_cast<size_t>(row)] == col) ? 3 : 0;
        return col_count_[static_cast<size_t>(col)]
             + major_count_[major_index(row, col)]
             + minor_count_[minor_index(row, col)]
             - self;
    }

    /**
     * @brief クイーンを移動し、カウンタと衝突行集合を更新する
     *
     * 現在の列への移動は no-op。
     */
    void move_queen(int row, int new_col);

    /**
     * @brief 衝突しているクイーンの行集合
     */
    const SparseSet& conflicted_rows() const { return conflicted_; }

    /**
     * @brief クイーンのいない列の集合
     */
    const SparseSet& free_columns() const { return free_cols_; }

    /**
     * @brief 全行配置済みかつ衝突なし
     */
    bool is_solution() const {
        return placed_ == static_cast<size_t>(n_) && conflicted_.empty();
    }

    /**
     * @brief 各クイーンの衝突数の総和（O(N)、診断用）
     */
    int64_t total_conflicts() const;

    int column_of(int row) const { return assignment_[static_cast<size_t>(row)]; }
    const std::vector<int>& assignment() const { return assignment_; }
    size_t placed_count() const { return placed_; }

    int column_count(int col) const { return col_count_[static_cast<size_t>(col)]; }
    int major_count(int row, int col) const { return major_count_[major_index(row, col)]; }
    int minor_count(int row, int col) const { return minor_count_[minor_index(row, col)]; }

private:
    // 再評価が必要な行（1回の移動で最大6）
    using Touched = std::array<int, 6>;

    size_t major_index(int row, int col) const {
        return static_cast<size_t>(row - col + n_ - 1);
    }
    size_t minor_index(int row, int col) const {
        return static_cast<size_t>(row + col);
    }

    void attach(int row, int col, Touched& touched, size_t& nt);
    void detach(int row, int col, Touched& touched, size_t& nt);
    void refresh(int row);

    int n_;
    size_t placed_ = 0;
    std::vector<int> assignment_;

    std::vector<int> col_count_;    // N
    std::vector<int> major_count_;  // 2N-1
    std::vector<int> minor_count_;  // 2N-1
    std::vector<int> col_xor_;
    std::vector<int> major_xor_;
    std::vector<int> minor_xor_;

    SparseSet conflicted_;
    SparseSet free_cols_;
};

} // namespace mcqueens

#endif // MCQUEENS_BOARD_HPP
