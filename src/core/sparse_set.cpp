#include "mcqueens/sparse_set.hpp"
#include <utility>

namespace mcqueens {

SparseSet::SparseSet(size_t capacity) {
    reset(capacity);
}

void SparseSet::reset(size_t capacity) {
    dense_.resize(capacity);
    sparse_.resize(capacity);
    for (size_t i = 0; i < capacity; ++i) {
        dense_[i] = static_cast<int>(i);
        sparse_[i] = i;
    }
    n_ = 0;
}

void SparseSet::fill() {
    n_ = dense_.size();
}

bool SparseSet::insert(int value) {
    auto idx_val = static_cast<size_t>(value);
    if (value < 0 || idx_val >= sparse_.size() || sparse_[idx_val] < n_) {
        return false;
    }
    // 無効領域の先頭と交換して有効領域に入れる
    swap_at(sparse_[idx_val], n_);
    ++n_;
    return true;
}

bool SparseSet::erase(int value) {
    auto idx_val = static_cast<size_t>(value);
    if (value < 0 || idx_val >= sparse_.size() || sparse_[idx_val] >= n_) {
        return false;  // 元々存在しない
    }
    swap_at(sparse_[idx_val], n_ - 1);
    --n_;
    return true;
}

void SparseSet::swap_at(size_t i, size_t j) {
    if (i == j) return;
    int vi = dense_[i];
    int vj = dense_[j];
    std::swap(dense_[i], dense_[j]);
    sparse_[static_cast<size_t>(vi)] = j;
    sparse_[static_cast<size_t>(vj)] = i;
}

} // namespace mcqueens
