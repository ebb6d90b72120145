#include "mcqueens/restart.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace mcqueens {

RestartResult solve_with_restarts(Solver& solver, const SolveRequest& request, int attempts) {
    if (attempts <= 0) {
        throw std::invalid_argument("attempts must be positive: " + std::to_string(attempts));
    }

    RestartResult result;
    result.best.steps_taken = request.max_steps;
    uint64_t seed0 = request.seed.value_or(kDefaultRestartSeed);

    for (int i = 0; i < attempts; ++i) {
        if (solver.is_stopped()) break;

        SolveRequest attempt_request = request;
        attempt_request.seed = seed0 + static_cast<uint64_t>(i);

        SolveResult res = solver.solve(attempt_request);
        result.attempts_run++;

        if (res.succeeded &&
            (!result.best.succeeded || res.steps_taken < result.best.steps_taken)) {
            result.best = std::move(res);
            result.best_stats = solver.stats();
            result.attempt = i + 1;
        } else if (!result.best.succeeded) {
            result.best_stats = solver.stats();
        }
    }
    return result;
}

} // namespace mcqueens
