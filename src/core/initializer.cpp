#include "mcqueens/initializer.hpp"
#include <limits>
#include <stdexcept>
#include <vector>

namespace mcqueens {

InitStrategy parse_init_strategy(const std::string& name) {
    if (name == "random") return InitStrategy::Random;
    if (name == "greedy") return InitStrategy::Greedy;
    throw std::invalid_argument("Unknown init strategy: " + name);
}

std::string to_string(InitStrategy strategy) {
    switch (strategy) {
        case InitStrategy::Random:
            return "random";
        case InitStrategy::Greedy:
            return "greedy";
    }
    return "unknown";
}

Board random_board(int n, Rng& rng) {
    Board board(n);
    for (int row = 0; row < n; ++row) {
        board.place(row, static_cast<int>(uniform_index(rng, static_cast<size_t>(n))));
    }
    return board;
}

Board greedy_board(int n, Rng& rng, int samples) {
    if (samples <= 0) {
        throw std::invalid_argument("greedy sample count must be positive");
    }
    Board board(n);
    bool full_scan = n <= samples;

    std::vector<int> candidates;
    candidates.reserve(static_cast<size_t>(full_scan ? n : samples));

    for (int row = 0; row < n; ++row) {
        int best = std::numeric_limits<int>::max();
        candidates.clear();

        auto consider = [&](int col) {
            int c = board.conflict_count(row, col);
            if (c < best) {
                best = c;
                candidates.clear();
                candidates.push_back(col);
            } else if (c == best) {
                candidates.push_back(col);
            }
        };

        if (full_scan) {
            for (int col = 0; col < n; ++col) {
                consider(col);
            }
        } else {
            // 配置済みの行は row 個なので空き列は常に残っている
            const auto& free_cols = board.free_columns();
            for (int i = 0; i < samples; ++i) {
                consider(free_cols[uniform_index(rng, free_cols.size())]);
            }
        }

        board.place(row, pick_uniform(candidates, rng));
    }
    return board;
}

Board initialize_board(int n, InitStrategy strategy, Rng& rng, int greedy_samples) {
    switch (strategy) {
        case InitStrategy::Random:
            return random_board(n, rng);
        case InitStrategy::Greedy:
            return greedy_board(n, rng, greedy_samples);
    }
    throw std::invalid_argument("Unknown init strategy");
}

} // namespace mcqueens
