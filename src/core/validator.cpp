#include "mcqueens/validator.hpp"
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace mcqueens {

bool is_solution(const std::vector<int>& assignment) {
    const auto n = static_cast<int64_t>(assignment.size());
    if (n == 0) return false;

    std::unordered_set<int64_t> columns;
    std::unordered_set<int64_t> majors;
    std::unordered_set<int64_t> minors;
    columns.reserve(assignment.size());
    majors.reserve(assignment.size());
    minors.reserve(assignment.size());

    for (int64_t row = 0; row < n; ++row) {
        int64_t col = assignment[static_cast<size_t>(row)];
        if (col < 0 || col >= n) return false;
        columns.insert(col);
        majors.insert(row - col);
        minors.insert(row + col);
    }

    auto expected = assignment.size();
    return columns.size() == expected && majors.size() == expected && minors.size() == expected;
}

int64_t attacking_pairs(const std::vector<int>& assignment) {
    const auto n = assignment.size();
    if (n == 0) return 0;

    std::vector<int64_t> cols(n, 0);
    std::vector<int64_t> majors(2 * n - 1, 0);
    std::vector<int64_t> minors(2 * n - 1, 0);

    for (size_t row = 0; row < n; ++row) {
        int col = assignment[row];
        if (col < 0 || static_cast<size_t>(col) >= n) {
            throw std::invalid_argument("column out of range at row " + std::to_string(row) +
                                        ": " + std::to_string(col));
        }
        auto c = static_cast<size_t>(col);
        cols[c]++;
        majors[row + n - 1 - c]++;
        minors[row + c]++;
    }

    // 異なる2行が2本以上の線を共有することはないので、線ごとの組数の和がそのまま答え
    int64_t pairs = 0;
    auto add = [&pairs](const std::vector<int64_t>& counts) {
        for (auto k : counts) {
            pairs += k * (k - 1) / 2;
        }
    };
    add(cols);
    add(majors);
    add(minors);
    return pairs;
}

} // namespace mcqueens
