#include "options.hpp"
#include "mcqueens/restart.hpp"
#include "mcqueens/solver.hpp"
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>
#include <csignal>
#include <unistd.h>

mcqueens::Solver* g_current_solver = nullptr;

void timeout_handler(int) {
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-n N] [-m STEPS] [-r ATTEMPTS] [-i random|greedy] [-g K] [-c K]"
                 " [--seed S] [-p] [-s] [-v] [-t SEC]\n";
    std::cerr << "  -n N        Board size (default 8)\n";
    std::cerr << "  -m STEPS    Maximum repair steps (default " << mcqueens::kDefaultMaxSteps << ")\n";
    std::cerr << "  -r ATTEMPTS Independent attempts with consecutive seeds (default 1)\n";
    std::cerr << "  -i STRATEGY Initial board: random or greedy (default greedy)\n";
    std::cerr << "  -g K        Columns sampled per row by the greedy initializer (default 50)\n";
    std::cerr << "  -c K        Columns sampled per repair step, 0 = exact scan (default 0)\n";
    std::cerr << "  --seed S    Random seed\n";
    std::cerr << "  -p          Always print the assignment\n";
    std::cerr << "  -s          Print solver statistics and wall-clock time to stderr\n";
    std::cerr << "  -v          Verbose mode (print init/repair progress)\n";
    std::cerr << "  -t SEC      Timeout in seconds\n";
}

void print_assignment(const std::vector<int>& assignment) {
    std::cout << "queens = [";
    for (std::size_t i = 0; i < assignment.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << assignment[i];
    }
    std::cout << "];\n";
}

int main(int argc, char* argv[]) {
    mcqueens::cli::Options opts;
    try {
        opts = mcqueens::cli::parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (opts.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    // Setup timeout
    if (opts.timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(static_cast<unsigned>(opts.timeout_sec));
    }

    try {
        mcqueens::Solver solver(opts.config);
        solver.set_verbose(opts.verbose);
        g_current_solver = &solver;

        auto start_time = std::chrono::steady_clock::now();
        mcqueens::SolveResult result;
        mcqueens::SolverStats stats;
        if (opts.attempts != 1) {
            auto restart = mcqueens::solve_with_restarts(solver, opts.request, opts.attempts);
            if (opts.verbose) {
                std::cerr << "% [verbose] attempts_run=" << restart.attempts_run
                          << " best_attempt=" << restart.attempt << "\n";
            }
            result = std::move(restart.best);
            stats = restart.best_stats;
        } else {
            result = solver.solve(opts.request);
            stats = solver.stats();
        }
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
        g_current_solver = nullptr;

        if (opts.print_stats) {
            std::cerr << mcqueens::cli::format_stats(stats, elapsed.count()) << "\n";
        }

        if (result.succeeded) {
            if (opts.print_board || opts.request.n <= 20) {
                print_assignment(*result.assignment);
            }
            std::cout << "steps = " << result.steps_taken << ";\n";
            std::cout << "==========\n";
        } else {
            std::cout << "steps = " << result.steps_taken << ";\n";
            std::cout << "=====UNKNOWN=====\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
