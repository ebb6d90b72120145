/**
 * @file sparse_set.hpp
 * @brief 0..capacity-1 の整数を保持する Sparse Set
 */
#ifndef MCQUEENS_SPARSE_SET_HPP
#define MCQUEENS_SPARSE_SET_HPP

#include <vector>
#include <cstddef>

namespace mcqueens {

/**
 * @brief Sparse Set（整数集合）
 *
 * O(1) の挿入・削除・存在確認と、dense 配列の添字による O(1) のランダム選択を提供する。
 * 削除は末尾要素との swap で行うため、要素の並び順は保証しない。
 */
class SparseSet {
public:
    SparseSet() = default;
    explicit SparseSet(size_t capacity);

    /**
     * @brief 容量を設定して空にする
     */
    void reset(size_t capacity);

    /**
     * @brief 0..capacity-1 を全て含む状態にする
     */
    void fill();

    bool empty() const { return n_ == 0; }
    size_t size() const { return n_; }
    size_t capacity() const { return sparse_.size(); }

    bool contains(int value) const {
        auto idx = static_cast<size_t>(value);
        return value >= 0 && idx < sparse_.size() && sparse_[idx] < n_;
    }

    /**
     * @brief 値を追加（既に存在すれば何もしない）
     * @return 追加されたらtrue
     */
    bool insert(int value);

    /**
     * @brief 値を削除（存在しなければ何もしない）
     * @return 削除されたらtrue
     */
    bool erase(int value);

    void clear() { n_ = 0; }

    /**
     * @brief dense 配列の i 番目の値（i < size()）
     */
    int operator[](size_t i) const { return dense_[i]; }

    const int* begin() const { return dense_.data(); }
    const int* end() const { return dense_.data() + n_; }

    /**
     * @brief 現在の要素のコピー（順不同）
     */
    std::vector<int> values() const { return std::vector<int>(begin(), end()); }

private:
    void swap_at(size_t i, size_t j);

    std::vector<int> dense_;      // Dense 配列（先頭 n_ 個が有効）
    std::vector<size_t> sparse_;  // 値 -> dense_ 上の位置
    size_t n_ = 0;                // 有効な値の数
};

} // namespace mcqueens

#endif // MCQUEENS_SPARSE_SET_HPP
