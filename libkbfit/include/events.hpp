/**
 * @file events.hpp
 * @brief Events published while a compression request runs.
 */

#ifndef KBFIT_EVENTS_HPP
#define KBFIT_EVENTS_HPP

#include "output_format.hpp"
#include "search_types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace kbfit {

/**
 * @brief Lightweight data carriers used with EventBus.
 *
 * They follow the life of one request: a search starts, emits one
 * ProbeEvent per oracle call and completes; formats without a quality
 * knob emit a single BestEffortEncodeEvent instead.
 */

/**
 * @brief Emitted before the first probe of a search.
 */
struct SearchStartEvent {
    OutputFormat format = OutputFormat::Jpeg;
    QualityBounds bounds{};
    std::uintmax_t target_max_bytes = 0;
};

/**
 * @brief Emitted after every oracle call.
 */
struct ProbeEvent {
    int quality = 0;                  ///< Quality probed
    std::size_t size = 0;             ///< Encoded size in bytes
    std::uintmax_t target_max_bytes = 0;
    bool feasible = false;            ///< size <= target_max_bytes
};

/**
 * @brief Emitted when a search terminates.
 */
struct SearchCompleteEvent {
    TerminalReason reason = TerminalReason::FeasibleFound;
    std::optional<int> quality;       ///< Chosen (or fallback) quality
    std::size_t size = 0;             ///< Size at that quality, 0 if none
    std::size_t iterations = 0;       ///< Number of probes
};

/**
 * @brief Emitted after the single encode of a non-searchable format.
 */
struct BestEffortEncodeEvent {
    OutputFormat format = OutputFormat::Png;
    std::size_t size = 0;
    std::uintmax_t target_max_bytes = 0;
    bool meets_target = false;
};

} // namespace kbfit

#endif // KBFIT_EVENTS_HPP
