#include "exit_policy.hpp"

WriteDecision decide_write(const kbfit::TerminalReason reason, const bool force) noexcept {
    if (reason == kbfit::TerminalReason::InfeasibleAtMinimum && !force) {
        return {false, kExitInfeasible};
    }
    return {true, kExitOk};
}

int merge_report_status(const int exit_code, const bool report_ok) noexcept {
    if (!report_ok && exit_code == kExitOk) {
        return kExitIoError;
    }
    return exit_code;
}
