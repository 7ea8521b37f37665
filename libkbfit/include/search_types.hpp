/**
 * @file search_types.hpp
 * @brief Value types shared by the feasibility oracle, the quality search
 * and the Compressor facade.
 */

#ifndef KBFIT_SEARCH_TYPES_HPP
#define KBFIT_SEARCH_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace kbfit {

/// Lowest quality value any codec accepts.
inline constexpr int kMinQuality = 1;
/// Highest quality value any codec accepts.
inline constexpr int kMaxQuality = 100;

/**
 * @brief Inclusive quality interval searched by the engine.
 */
struct QualityBounds {
    int min_quality = 25;
    int max_quality = 95;

    bool operator==(const QualityBounds&) const = default;
};

/**
 * @brief One encode-and-measure operation.
 *
 * The encoded bytes are owned transiently; the search discards them
 * unless the probe becomes the current best or the fallback.
 */
struct ProbeResult {
    int quality = 0;
    std::size_t size = 0;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Byte-free summary of one probe, kept in the probe trail.
 */
struct ProbeRecord {
    int quality = 0;
    std::size_t size = 0;
    bool feasible = false;

    bool operator==(const ProbeRecord&) const = default;
};

/**
 * @brief Why a compression request stopped.
 */
enum class TerminalReason {
    FeasibleFound,       ///< A quality within bounds meets the target
    InfeasibleAtMinimum, ///< Even min_quality exceeds the target
    NotSearchable        ///< Format has no quality knob; single best-effort encode
};

std::string_view to_string(TerminalReason reason) noexcept;

/**
 * @brief Result of one quality search.
 *
 * Invariants: best, if present, satisfies size <= target and has a
 * quality inside the searched bounds. fallback is only set when best is
 * absent and holds the min_quality probe.
 */
struct SearchOutcome {
    std::optional<ProbeResult> best;
    std::optional<ProbeResult> fallback;
    TerminalReason reason = TerminalReason::InfeasibleAtMinimum;
    std::vector<ProbeRecord> trail;

    /// @return Quality of best, else of fallback, else nullopt.
    [[nodiscard]] std::optional<int> final_quality() const {
        if (best) return best->quality;
        if (fallback) return fallback->quality;
        return std::nullopt;
    }

    /// @return Number of oracle calls made.
    [[nodiscard]] std::size_t iterations() const noexcept { return trail.size(); }
};

} // namespace kbfit

#endif // KBFIT_SEARCH_TYPES_HPP
