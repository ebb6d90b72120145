/**
 * @file options.hpp
 * @brief コマンドライン引数の解析と統計行の整形
 */
#ifndef MCQUEENS_CLI_OPTIONS_HPP
#define MCQUEENS_CLI_OPTIONS_HPP

#include "mcqueens/solver.hpp"
#include <cstdint>
#include <string>

namespace mcqueens {
namespace cli {

/**
 * @brief 解析済みのオプション
 */
struct Options {
    SolveRequest request;
    SolverConfig config;
    int attempts = 1;
    int timeout_sec = 0;
    bool print_board = false;
    bool print_stats = false;
    bool verbose = false;
    bool show_help = false;

    Options() { request.n = 8; }
};

/**
 * @brief 整数オプションを解析（[min, max] の範囲外、または数値でなければ例外）
 * @throws std::runtime_error 不正な値
 */
int64_t parse_number(const char* option, const char* text, int64_t min, int64_t max);

/**
 * @brief 引数全体を解析
 * @throws std::runtime_error 未知のオプション、値の欠落、不正な値
 * @throws std::invalid_argument 未知の初期化戦略
 */
Options parse_options(int argc, const char* const argv[]);

/**
 * @brief "% Stats: ..." 行（末尾の改行なし）
 */
std::string format_stats(const SolverStats& stats, double seconds);

} // namespace cli
} // namespace mcqueens

#endif // MCQUEENS_CLI_OPTIONS_HPP
