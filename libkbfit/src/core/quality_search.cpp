/**
 * @file quality_search.cpp
 * @brief Implementation of the bounded binary quality search.
 */

#include "../../include/quality_search.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <string>
#include <utility>

namespace kbfit {

std::string_view to_string(const TerminalReason reason) noexcept {
    switch (reason) {
        case TerminalReason::FeasibleFound:       return "feasible-found";
        case TerminalReason::InfeasibleAtMinimum: return "infeasible-at-minimum";
        case TerminalReason::NotSearchable:       return "format-not-searchable";
    }
    return "unknown";
}

void validate_bounds(const QualityBounds& bounds, const std::uintmax_t target_max_bytes) {
    const auto describe = [&bounds] {
        return "[" + std::to_string(bounds.min_quality) + ", " + std::to_string(bounds.max_quality) + "]";
    };

    if (bounds.min_quality > bounds.max_quality) {
        throw InvalidBounds("min_quality > max_quality in " + describe());
    }
    if (bounds.min_quality < kMinQuality || bounds.max_quality > kMaxQuality) {
        throw InvalidBounds("quality bounds " + describe() + " outside [" +
                            std::to_string(kMinQuality) + ", " + std::to_string(kMaxQuality) + "]");
    }
    if (target_max_bytes == 0) {
        throw InvalidBounds("target size must be greater than zero");
    }
}

namespace {

/**
 * @brief Per-call accumulator; never shared between searches.
 */
class SearchState {
public:
    explicit SearchState(FeasibilityOracle& oracle) : oracle_(oracle) {}

    /// Probes q, records it in the trail and updates best/fallback.
    /// @return True if the probe was feasible.
    bool probe(const int quality) {
        ProbeResult result = oracle_.probe(quality);
        const bool feasible = oracle_.is_feasible(result);
        outcome_.trail.push_back({result.quality, result.size, feasible});

        if (feasible) {
            // the search only moves upward after a success
            if (!outcome_.best || result.quality > outcome_.best->quality) {
                outcome_.best = std::move(result);
            }
        } else if (!outcome_.fallback || result.quality < outcome_.fallback->quality) {
            outcome_.fallback = std::move(result);
        }
        return feasible;
    }

    SearchOutcome finish() {
        if (outcome_.best) {
            outcome_.reason = TerminalReason::FeasibleFound;
            outcome_.fallback.reset();
        } else {
            outcome_.reason = TerminalReason::InfeasibleAtMinimum;
        }
        return std::move(outcome_);
    }

private:
    FeasibilityOracle& oracle_;
    SearchOutcome outcome_;
};

} // namespace

SearchOutcome search_max_quality(FeasibilityOracle& oracle,
                                 const QualityBounds& bounds,
                                 const SearchOptions& options) {
    validate_bounds(bounds, oracle.target_max_bytes());

    Logger::log(LogLevel::Info,
                "Searching quality in [" + std::to_string(bounds.min_quality) + ", " +
                std::to_string(bounds.max_quality) + "] for <= " +
                std::to_string(oracle.target_max_bytes()) + " bytes with " +
                std::string(oracle.codec().get_name()),
                "quality_search");

    SearchState state(oracle);
    int lo = bounds.min_quality;
    int hi = bounds.max_quality;

    bool done = false;
    if (options.probe_bounds_first) {
        if (state.probe(hi)) {
            Logger::log(LogLevel::Debug, "max_quality already fits", "quality_search");
            done = true;
        } else if (lo == hi || !state.probe(lo)) {
            done = true;
        } else {
            // min fits and max does not: bisect the open interval
            ++lo;
            --hi;
        }
    }

    while (!done && lo <= hi) {
        const int mid = lo + (hi - lo) / 2;
        if (state.probe(mid)) {
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }

    SearchOutcome outcome = state.finish();
    if (outcome.best) {
        Logger::log(LogLevel::Info,
                    "Best quality " + std::to_string(outcome.best->quality) + " (" +
                    std::to_string(outcome.best->size) + " bytes) after " +
                    std::to_string(outcome.iterations()) + " probes",
                    "quality_search");
    } else if (outcome.fallback) {
        Logger::log(LogLevel::Warning,
                    "No quality fits; quality " + std::to_string(outcome.fallback->quality) +
                    " still produces " + std::to_string(outcome.fallback->size) + " bytes",
                    "quality_search");
    }
    return outcome;
}

} // namespace kbfit
