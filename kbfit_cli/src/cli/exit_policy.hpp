#ifndef KBFIT_EXIT_POLICY_HPP
#define KBFIT_EXIT_POLICY_HPP

#include "../../../libkbfit/include/search_types.hpp"

// process exit codes
constexpr int kExitOk = 0;
constexpr int kExitIoError = 1;
constexpr int kExitEncodingError = 2;
constexpr int kExitInfeasible = 3;
constexpr int kExitInvalidRequest = 4;

/**
 * @brief Whether a search result is written, and the exit code it leads to.
 */
struct WriteDecision {
    bool write = true;
    int exit_code = kExitOk;
};

/**
 * @brief Applies the --force policy to a terminal reason.
 *
 * InfeasibleAtMinimum is not written and exits kExitInfeasible unless
 * forced, in which case the minimum-quality bytes are written and the run
 * exits kExitOk. Every other reason is written.
 */
[[nodiscard]] WriteDecision decide_write(kbfit::TerminalReason reason, bool force) noexcept;

/**
 * @brief Folds the outcome of the --report export into the exit code.
 *
 * A failed export turns an otherwise successful run into kExitIoError;
 * an earlier failure keeps its own code.
 */
[[nodiscard]] int merge_report_status(int exit_code, bool report_ok) noexcept;

#endif // KBFIT_EXIT_POLICY_HPP
