#include "mcqueens/solver.hpp"
#include "mcqueens/validator.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace mcqueens {

namespace {
constexpr int64_t kProgressInterval = 10000;

Rng make_rng(const std::optional<uint64_t>& seed) {
    if (seed) {
        return Rng(*seed);
    }
    std::random_device rd;
    return Rng((static_cast<uint64_t>(rd()) << 32) ^ rd());
}
}  // namespace

Solver::Solver() = default;

Solver::Solver(SolverConfig config)
    : config_(config) {}

void Solver::validate(const SolveRequest& request) const {
    if (request.n <= 0) {
        throw std::invalid_argument("n must be positive: " + std::to_string(request.n));
    }
    if (request.max_steps <= 0) {
        throw std::invalid_argument("max_steps must be positive: " +
                                    std::to_string(request.max_steps));
    }
    if (config_.greedy_samples <= 0) {
        throw std::invalid_argument("greedy_samples must be positive: " +
                                    std::to_string(config_.greedy_samples));
    }
    if (config_.column_samples < 0) {
        throw std::invalid_argument("column_samples must not be negative: " +
                                    std::to_string(config_.column_samples));
    }
}

SolveResult Solver::solve(const SolveRequest& request) {
    validate(request);
    stats_ = SolverStats{};

    Rng rng = make_rng(request.seed);

    if (verbose_) {
        std::cerr << "% [verbose] init start: n=" << request.n
                  << " strategy=" << to_string(config_.init_strategy) << "\n";
    }
    Board board = initialize_board(request.n, config_.init_strategy, rng, config_.greedy_samples);

    stats_.init_conflicted_rows = board.conflicted_rows().size();
    stats_.init_total_conflicts = board.total_conflicts();
    if (verbose_) {
        std::cerr << "% [verbose] init done: conflicted_rows=" << stats_.init_conflicted_rows
                  << " total_conflicts=" << stats_.init_total_conflicts
                  << " free_columns=" << board.free_columns().size() << "\n";
    }

    SolveResult result = repair(board, request.max_steps, rng);

    if (result.succeeded && config_.verify && !mcqueens::is_solution(*result.assignment)) {
        throw std::logic_error("internal error: board reports a solution that fails validation (n=" +
                               std::to_string(request.n) + ")");
    }

    if (verbose_) {
        std::cerr << "% [verbose] " << (result.succeeded ? "solved" : "gave up")
                  << " after " << result.steps_taken << " steps"
                  << " (moves=" << stats_.moves
                  << " noop=" << stats_.noop_steps << ")\n";
    }
    return result;
}

SolveResult Solver::repair(Board& board, int64_t max_steps, Rng& rng) {
    SolveResult result;
    int64_t steps = 0;

    while (true) {
        if (board.is_solution()) {
            result.assignment = board.assignment();
            result.succeeded = true;
            break;
        }
        if (steps >= max_steps || stopped_) {
            if (verbose_ && stopped_) {
                std::cerr << "% [verbose] search stopped at step " << steps << "\n";
            }
            break;
        }

        step(board, rng);
        ++steps;

        if (verbose_ && steps % kProgressInterval == 0) {
            std::cerr << "% [verbose] step=" << steps
                      << " conflicted_rows=" << board.conflicted_rows().size()
                      << " free_columns=" << board.free_columns().size() << "\n";
        }
    }

    result.steps_taken = steps;
    stats_.steps = steps;
    return result;
}

void Solver::step(Board& board, Rng& rng) {
    const auto& conflicted = board.conflicted_rows();
    int row = conflicted[uniform_index(rng, conflicted.size())];

    int col = choose_column(board, row, rng);

    if (col == board.column_of(row)) {
        stats_.noop_steps++;
    } else {
        board.move_queen(row, col);
        stats_.moves++;
    }
}

int Solver::choose_column(const Board& board, int row, Rng& rng) {
    bool sampled = config_.column_samples > 0 && board.size() > config_.column_samples;
    return sampled ? select_column_sampled(board, row, rng)
                   : select_column(board, row, rng);
}

int Solver::select_column(const Board& board, int row, Rng& rng) {
    candidates_.clear();

    // 衝突0の列（現在列以外）は必ず空き列なので、空き列で0が見つかればそれが全ての最小列
    for (int col : board.free_columns()) {
        if (board.conflict_count(row, col) == 0) {
            candidates_.push_back(col);
        }
    }
    if (!candidates_.empty()) {
        stats_.free_column_hits++;
        return pick_uniform(candidates_, rng);
    }

    stats_.full_scans++;
    int best = std::numeric_limits<int>::max();
    const int n = board.size();
    for (int col = 0; col < n; ++col) {
        int c = board.conflict_count(row, col);
        if (c < best) {
            best = c;
            candidates_.clear();
            candidates_.push_back(col);
        } else if (c == best) {
            candidates_.push_back(col);
        }
    }
    return pick_uniform(candidates_, rng);
}

int Solver::select_column_sampled(const Board& board, int row, Rng& rng) {
    candidates_.clear();
    int best = std::numeric_limits<int>::max();

    auto n = static_cast<size_t>(board.size());
    if (seen_.size() != n) {
        seen_.assign(n, 0);
        stamp_ = 0;
    }
    if (++stamp_ == 0) {
        std::fill(seen_.begin(), seen_.end(), 0);
        stamp_ = 1;
    }

    // 1回の呼び出しで各列は高々1度だけ候補に入る
    auto consider = [&](int col) {
        auto& mark = seen_[static_cast<size_t>(col)];
        if (mark == stamp_) return;
        mark = stamp_;

        int c = board.conflict_count(row, col);
        if (c < best) {
            best = c;
            candidates_.clear();
            candidates_.push_back(col);
        } else if (c == best) {
            candidates_.push_back(col);
        }
    };

    // 現在列は常に候補（最適なら動かない）
    consider(board.column_of(row));

    const auto& free_cols = board.free_columns();
    if (!free_cols.empty()) {
        for (int i = 0; i < config_.column_samples; ++i) {
            consider(free_cols[uniform_index(rng, free_cols.size())]);
        }
    }

    for (int i = 0; i < config_.column_samples / 2; ++i) {
        consider(static_cast<int>(uniform_index(rng, n)));
    }

    return pick_uniform(candidates_, rng);
}

} // namespace mcqueens
