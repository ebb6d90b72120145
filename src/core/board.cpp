#include "mcqueens/board.hpp"
#include <stdexcept>
#include <string>

namespace mcqueens {

namespace {
int checked_size(int n) {
    if (n <= 0) {
        throw std::invalid_argument("board size must be positive: " + std::to_string(n));
    }
    return n;
}
}  // namespace

Board::Board(int n)
    : n_(checked_size(n))
    , assignment_(static_cast<size_t>(n_), kUnplaced)
    , col_count_(static_cast<size_t>(n_), 0)
    , major_count_(static_cast<size_t>(2 * n_ - 1), 0)
    , minor_count_(static_cast<size_t>(2 * n_ - 1), 0)
    , col_xor_(static_cast<size_t>(n_), 0)
    , major_xor_(static_cast<size_t>(2 * n_ - 1), 0)
    , minor_xor_(static_cast<size_t>(2 * n_ - 1), 0)
    , conflicted_(static_cast<size_t>(n_))
    , free_cols_(static_cast<size_t>(n_)) {
    free_cols_.fill();
}

Board::Board(const std::vector<int>& assignment)
    : Board(static_cast<int>(assignment.size())) {
    for (size_t row = 0; row < assignment.size(); ++row) {
        int col = assignment[row];
        if (col < 0 || col >= n_) {
            throw std::invalid_argument("column out of range at row " + std::to_string(row) +
                                        ": " + std::to_string(col));
        }
        place(static_cast<int>(row), col);
    }
}

void Board::place(int row, int col) {
    if (row < 0 || row >= n_ || col < 0 || col >= n_) {
        throw std::invalid_argument("position out of range: (" + std::to_string(row) + ", " +
                                    std::to_string(col) + ")");
    }
    auto r = static_cast<size_t>(row);
    if (assignment_[r] != kUnplaced) {
        throw std::logic_error("row already placed: " + std::to_string(row));
    }

    Touched touched;
    size_t nt = 0;
    attach(row, col, touched, nt);
    assignment_[r] = col;
    ++placed_;

    for (size_t i = 0; i < nt; ++i) {
        refresh(touched[i]);
    }
    refresh(row);
}

void Board::move_queen(int row, int new_col) {
    auto r = static_cast<size_t>(row);
    int old_col = assignment_[r];
    if (old_col == new_col) return;

    // 旧位置と新位置は列も対角線も共有しないので、6本の線は全て異なる
    Touched touched;
    size_t nt = 0;
    detach(row, old_col, touched, nt);
    attach(row, new_col, touched, nt);
    assignment_[r] = new_col;

    for (size_t i = 0; i < nt; ++i) {
        refresh(touched[i]);
    }
    refresh(row);
}

void Board::attach(int row, int col, Touched& touched, size_t& nt) {
    auto c = static_cast<size_t>(col);
    auto d1 = major_index(row, col);
    auto d2 = minor_index(row, col);

    // 1 -> 2: 既存の唯一のクイーンが新たに衝突する
    if (col_count_[c] == 0) {
        free_cols_.erase(col);
    } else if (col_count_[c] == 1) {
        touched[nt++] = col_xor_[c];
    }
    if (major_count_[d1] == 1) touched[nt++] = major_xor_[d1];
    if (minor_count_[d2] == 1) touched[nt++] = minor_xor_[d2];

    ++col_count_[c];
    ++major_count_[d1];
    ++minor_count_[d2];
    col_xor_[c] ^= row;
    major_xor_[d1] ^= row;
    minor_xor_[d2] ^= row;
}

void Board::detach(int row, int col, Touched& touched, size_t& nt) {
    auto c = static_cast<size_t>(col);
    auto d1 = major_index(row, col);
    auto d2 = minor_index(row, col);

    --col_count_[c];
    --major_count_[d1];
    --minor_count_[d2];
    col_xor_[c] ^= row;
    major_xor_[d1] ^= row;
    minor_xor_[d2] ^= row;

    // 2 -> 1: 残った唯一のクイーンの衝突が解消している可能性がある
    if (col_count_[c] == 0) {
        free_cols_.insert(col);
    } else if (col_count_[c] == 1) {
        touched[nt++] = col_xor_[c];
    }
    if (major_count_[d1] == 1) touched[nt++] = major_xor_[d1];
    if (minor_count_[d2] == 1) touched[nt++] = minor_xor_[d2];
}

void Board::refresh(int row) {
    int col = assignment_[static_cast<size_t>(row)];
    if (col != kUnplaced && conflict_count(row, col) > 0) {
        conflicted_.insert(row);
    } else {
        conflicted_.erase(row);
    }
}

int64_t Board::total_conflicts() const {
    int64_t total = 0;
    for (int row = 0; row < n_; ++row) {
        int col = assignment_[static_cast<size_t>(row)];
        if (col != kUnplaced) {
            total += conflict_count(row, col);
        }
    }
    return total;
}

} // namespace mcqueens
