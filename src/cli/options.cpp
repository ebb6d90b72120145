#include "options.hpp"
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mcqueens {
namespace cli {

namespace {
constexpr int64_t kIntMax = std::numeric_limits<int>::max();
constexpr int64_t kIntMin = std::numeric_limits<int>::min();

int parse_int(const char* option, const char* text, int64_t min = kIntMin) {
    return static_cast<int>(parse_number(option, text, min, kIntMax));
}
}  // namespace

int64_t parse_number(const char* option, const char* text, int64_t min, int64_t max) {
    std::size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid value for ") + option + ": " + text);
    }
    if (text[pos] != '\0' || value < min || value > max) {
        throw std::runtime_error(std::string("Invalid value for ") + option + ": " + text);
    }
    return static_cast<int64_t>(value);
}

Options parse_options(int argc, const char* const argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        auto takes_value = [&](const char* name) {
            if (std::strcmp(arg, name) != 0) return false;
            if (!has_value) {
                throw std::runtime_error(std::string("Missing value for ") + name);
            }
            return true;
        };

        if (takes_value("-n")) {
            opts.request.n = parse_int("-n", argv[++i]);
        } else if (takes_value("-m")) {
            opts.request.max_steps = parse_number("-m", argv[++i],
                                                  std::numeric_limits<int64_t>::min(),
                                                  std::numeric_limits<int64_t>::max());
        } else if (takes_value("-r")) {
            opts.attempts = parse_int("-r", argv[++i]);
        } else if (takes_value("-i")) {
            opts.config.init_strategy = parse_init_strategy(argv[++i]);
        } else if (takes_value("-g")) {
            opts.config.greedy_samples = parse_int("-g", argv[++i]);
        } else if (takes_value("-c")) {
            opts.config.column_samples = parse_int("-c", argv[++i]);
        } else if (takes_value("--seed")) {
            opts.request.seed = static_cast<uint64_t>(
                parse_number("--seed", argv[++i], 0, std::numeric_limits<int64_t>::max()));
        } else if (takes_value("-t")) {
            opts.timeout_sec = parse_int("-t", argv[++i], 0);
        } else if (std::strcmp(arg, "-p") == 0) {
            opts.print_board = true;
        } else if (std::strcmp(arg, "-s") == 0) {
            opts.print_stats = true;
        } else if (std::strcmp(arg, "-v") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            opts.show_help = true;
        } else {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }
    }
    return opts;
}

std::string format_stats(const SolverStats& s, double seconds) {
    std::ostringstream out;
    out << "% Stats: steps=" << s.steps
        << " moves=" << s.moves
        << " noop=" << s.noop_steps
        << " full_scans=" << s.full_scans
        << " free_column_hits=" << s.free_column_hits
        << " init_conflicted_rows=" << s.init_conflicted_rows
        << " init_total_conflicts=" << s.init_total_conflicts
        << " time=" << std::fixed << std::setprecision(4) << seconds << "s";
    return out.str();
}

} // namespace cli
} // namespace mcqueens
