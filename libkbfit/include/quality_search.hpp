/**
 * @file quality_search.hpp
 * @brief Binary search for the highest quality that fits a byte budget.
 */

#ifndef KBFIT_QUALITY_SEARCH_HPP
#define KBFIT_QUALITY_SEARCH_HPP

#include "feasibility_oracle.hpp"
#include "search_types.hpp"
#include <cstdint>

namespace kbfit {

/**
 * @brief Tuning knobs for search_max_quality().
 */
struct SearchOptions {
    /**
     * Probe max_quality first (stop if it fits), then min_quality (stop
     * if it does not), and only then bisect the interior. Saves probes
     * when the target is very loose or very tight, but can exceed the
     * ceil(log2(N)) bound of the plain search by two probes.
     */
    bool probe_bounds_first = false;
};

/**
 * @brief Validate a quality interval and byte target.
 * @throws InvalidBounds if min > max, either bound is outside
 * [kMinQuality, kMaxQuality], or target_max_bytes is zero.
 */
void validate_bounds(const QualityBounds& bounds, std::uintmax_t target_max_bytes);

/**
 * @brief Find the maximal quality Q in bounds with probe(Q).size <= target.
 *
 * Assumes size is non-decreasing in quality. Each iteration probes
 * mid = floor((lo + hi) / 2); a feasible probe becomes the new best and
 * moves lo above it, an infeasible one moves hi below it. The loop
 * ends when lo > hi, after at most ceil(log2(max - min + 2)) probes.
 *
 * If no probe fits, reason is InfeasibleAtMinimum and fallback holds
 * the min_quality probe (the plain search always reaches it in that
 * case). When the encoder is not monotonic the search still terminates
 * but may miss a feasible quality above the one it returns.
 *
 * @param oracle Oracle bound to the image, codec and target.
 * @param bounds Inclusive quality interval.
 * @param options Search options.
 * @return The outcome; the best/fallback accumulators are owned by this call.
 * @throws InvalidBounds before any probe if the bounds are invalid.
 * @throws EncodingError if a probe fails.
 */
[[nodiscard]] SearchOutcome search_max_quality(FeasibilityOracle& oracle,
                                               const QualityBounds& bounds,
                                               const SearchOptions& options = {});

} // namespace kbfit

#endif // KBFIT_QUALITY_SEARCH_HPP
