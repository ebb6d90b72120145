#include <catch2/catch.hpp>
#include "mcqueens/board.hpp"
#include "mcqueens/sparse_set.hpp"
#include "mcqueens/random.hpp"
#include "mcqueens/validator.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace mcqueens;

namespace {

// 一から数えた衝突数（row 自身は除く）
int brute_conflicts(const std::vector<int>& assignment, int row, int col) {
    int n = static_cast<int>(assignment.size());
    int count = 0;
    for (int r = 0; r < n; ++r) {
        if (r == row) continue;
        int c = assignment[static_cast<size_t>(r)];
        if (c == col) ++count;
        if (r - c == row - col) ++count;
        if (r + c == row + col) ++count;
    }
    return count;
}

std::vector<int> brute_conflicted_rows(const std::vector<int>& assignment) {
    std::vector<int> rows;
    for (size_t r = 0; r < assignment.size(); ++r) {
        int row = static_cast<int>(r);
        if (brute_conflicts(assignment, row, assignment[r]) > 0) {
            rows.push_back(row);
        }
    }
    return rows;
}

std::vector<int> sorted(std::vector<int> v) {
    std::sort(v.begin(), v.end());
    return v;
}

std::vector<int> random_assignment(int n, Rng& rng) {
    std::vector<int> a(static_cast<size_t>(n));
    for (auto& c : a) {
        c = static_cast<int>(uniform_index(rng, static_cast<size_t>(n)));
    }
    return a;
}

void check_counters(const Board& board) {
    const auto& a = board.assignment();
    int n = board.size();
    for (int row = 0; row < n; ++row) {
        int col = a[static_cast<size_t>(row)];
        REQUIRE(board.column_count(col) >= 1);
        REQUIRE(board.major_count(row, col) >= 1);
        REQUIRE(board.minor_count(row, col) >= 1);
    }
    REQUIRE(sorted(board.conflicted_rows().values()) == brute_conflicted_rows(a));

    std::vector<int> free_cols;
    for (int col = 0; col < n; ++col) {
        if (std::find(a.begin(), a.end(), col) == a.end()) {
            free_cols.push_back(col);
        }
    }
    REQUIRE(sorted(board.free_columns().values()) == free_cols);
}

}  // namespace

// ============================================================================
// SparseSet tests
// ============================================================================

TEST_CASE("SparseSet basic operations", "[sparse_set]") {
    SparseSet s(5);

    SECTION("initially empty") {
        REQUIRE(s.empty());
        REQUIRE(s.capacity() == 5);
        REQUIRE(!s.contains(0));
    }

    SECTION("insert and erase") {
        REQUIRE(s.insert(3));
        REQUIRE(!s.insert(3));  // 既に存在
        REQUIRE(s.insert(0));
        REQUIRE(s.size() == 2);
        REQUIRE(s.contains(3));
        REQUIRE(s.erase(3));
        REQUIRE(!s.erase(3));
        REQUIRE(!s.contains(3));
        REQUIRE(s.contains(0));
        REQUIRE(s.size() == 1);
        REQUIRE(s[0] == 0);
    }

    SECTION("out of range values") {
        REQUIRE(!s.insert(-1));
        REQUIRE(!s.insert(5));
        REQUIRE(!s.contains(-1));
        REQUIRE(!s.contains(7));
        REQUIRE(!s.erase(9));
    }

    SECTION("fill") {
        s.fill();
        REQUIRE(s.size() == 5);
        REQUIRE(sorted(s.values()) == std::vector<int>{0, 1, 2, 3, 4});
        s.clear();
        REQUIRE(s.empty());
    }
}

// ============================================================================
// Board tests
// ============================================================================

TEST_CASE("Board construction", "[board]") {
    SECTION("non-positive size is rejected") {
        REQUIRE_THROWS_AS(Board(0), std::invalid_argument);
        REQUIRE_THROWS_AS(Board(-3), std::invalid_argument);
        REQUIRE_THROWS_AS(Board(std::vector<int>{}), std::invalid_argument);
    }

    SECTION("column out of range is rejected") {
        std::vector<int> too_large{0, 4, 1, 2};
        std::vector<int> negative{0, -1, 1, 2};
        REQUIRE_THROWS_AS(Board(too_large), std::invalid_argument);
        REQUIRE_THROWS_AS(Board(negative), std::invalid_argument);
    }

    SECTION("empty board") {
        Board board(4);
        REQUIRE(board.size() == 4);
        REQUIRE(board.placed_count() == 0);
        REQUIRE(board.conflicted_rows().empty());
        REQUIRE(board.free_columns().size() == 4);
        REQUIRE(!board.is_solution());  // 未配置の行がある
    }

    SECTION("placing a row twice fails") {
        Board board(4);
        board.place(0, 1);
        REQUIRE_THROWS_AS(board.place(0, 2), std::logic_error);
        REQUIRE(board.column_of(0) == 1);
    }

    SECTION("placing outside the board is rejected") {
        Board board(4);
        REQUIRE_THROWS_AS(board.place(4, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(board.place(-1, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(board.place(0, 4), std::invalid_argument);
        REQUIRE_THROWS_AS(board.place(0, -1), std::invalid_argument);
        REQUIRE(board.placed_count() == 0);
        REQUIRE(board.free_columns().size() == 4);
        REQUIRE(board.conflicted_rows().empty());
    }
}

TEST_CASE("Board known configurations", "[board]") {
    SECTION("4-queens solution") {
        Board board(std::vector<int>{1, 3, 0, 2});
        REQUIRE(board.is_solution());
        REQUIRE(board.conflicted_rows().empty());
        REQUIRE(board.free_columns().empty());
        REQUIRE(board.total_conflicts() == 0);
        for (int row = 0; row < 4; ++row) {
            REQUIRE(board.conflict_count(row, board.column_of(row)) == 0);
        }
    }

    SECTION("main diagonal") {
        Board board(std::vector<int>{0, 1, 2, 3});
        REQUIRE(!board.is_solution());
        REQUIRE(board.conflicted_rows().size() == 4);
        // 全員が同じ主対角線上
        REQUIRE(board.conflict_count(0, 0) == 3);
        // 列 1 の row 1 とだけ衝突
        REQUIRE(board.conflict_count(0, 1) == 1);
        REQUIRE(board.conflict_count(0, 1) == brute_conflicts({0, 1, 2, 3}, 0, 1));
        REQUIRE(board.total_conflicts() == 2 * attacking_pairs({0, 1, 2, 3}));
    }

    SECTION("single queen") {
        Board board(std::vector<int>{0});
        REQUIRE(board.is_solution());
        REQUIRE(board.conflict_count(0, 0) == 0);
    }

    SECTION("same column") {
        Board board(std::vector<int>{0, 0});
        REQUIRE(board.conflict_count(0, 0) == 1);
        REQUIRE(board.conflict_count(1, 0) == 1);
        REQUIRE(board.free_columns().size() == 1);
        REQUIRE(board.free_columns().contains(1));
    }
}

TEST_CASE("Board conflict_count matches brute force", "[board][cross_check]") {
    Rng rng(2024);
    for (int trial = 0; trial < 20; ++trial) {
        int n = 1 + static_cast<int>(uniform_index(rng, 40));
        auto a = random_assignment(n, rng);
        Board board(a);

        for (int row = 0; row < n; ++row) {
            for (int col = 0; col < n; ++col) {
                REQUIRE(board.conflict_count(row, col) == brute_conflicts(a, row, col));
            }
        }
        check_counters(board);
        REQUIRE(board.total_conflicts() == 2 * attacking_pairs(a));
    }
}

TEST_CASE("Board move_queen keeps counters consistent", "[board][cross_check]") {
    Rng rng(7);
    for (int trial = 0; trial < 10; ++trial) {
        int n = 2 + static_cast<int>(uniform_index(rng, 30));
        Board board(random_assignment(n, rng));

        for (int move = 0; move < 200; ++move) {
            int row = static_cast<int>(uniform_index(rng, static_cast<size_t>(n)));
            int col = static_cast<int>(uniform_index(rng, static_cast<size_t>(n)));
            board.move_queen(row, col);
            REQUIRE(board.column_of(row) == col);
        }

        const auto& a = board.assignment();
        for (int row = 0; row < n; ++row) {
            for (int col = 0; col < n; ++col) {
                REQUIRE(board.conflict_count(row, col) == brute_conflicts(a, row, col));
            }
        }
        check_counters(board);
        REQUIRE(board.is_solution() == is_solution(a));
    }
}

TEST_CASE("Board move_queen updates other rows", "[board]") {
    // row 0 と row 1 は列 0 を共有
    Board board(std::vector<int>{0, 0, 3, 1});
    REQUIRE(board.conflicted_rows().contains(0));
    REQUIRE(board.conflicted_rows().contains(1));

    SECTION("leaving a shared column clears the remaining queen") {
        board.move_queen(1, 2);  // {0, 2, 3, 1}: row 1 と row 2 は副対角線を共有しない
        check_counters(board);
    }

    SECTION("moving onto an occupied column marks the occupant") {
        Board b(std::vector<int>{1, 3, 0, 2});
        REQUIRE(b.is_solution());
        b.move_queen(0, 0);  // 列 0 の row 2 と衝突
        REQUIRE(b.conflicted_rows().contains(0));
        REQUIRE(b.conflicted_rows().contains(2));
        check_counters(b);
        b.move_queen(0, 1);
        REQUIRE(b.is_solution());
    }

    SECTION("moving to the current column is a no-op") {
        auto before = board.assignment();
        auto conflicted = sorted(board.conflicted_rows().values());
        board.move_queen(2, 3);
        REQUIRE(board.assignment() == before);
        REQUIRE(sorted(board.conflicted_rows().values()) == conflicted);
    }
}

TEST_CASE("Board place on a partial board", "[board]") {
    Board board(5);
    board.place(0, 0);
    REQUIRE(board.conflicted_rows().empty());
    // 未配置の行は自分を差し引かない
    REQUIRE(board.conflict_count(1, 0) == 1);
    REQUIRE(board.conflict_count(1, 1) == 1);
    REQUIRE(board.conflict_count(1, 2) == 0);

    board.place(1, 1);
    REQUIRE(board.conflicted_rows().size() == 2);
    REQUIRE(board.placed_count() == 2);
    REQUIRE(board.free_columns().size() == 3);
}
