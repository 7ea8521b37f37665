/**
 * @file format_strategy.hpp
 * @brief Decides whether the quality search applies to an output format.
 */

#ifndef KBFIT_FORMAT_STRATEGY_HPP
#define KBFIT_FORMAT_STRATEGY_HPP

#include "output_format.hpp"
#include <string_view>

namespace kbfit {

enum class SearchApplicability {
    Searchable,   ///< Lossy format with a size-correlated quality knob
    NotSearchable ///< Single best-effort encode, target not guaranteed
};

/**
 * @brief Classify a format. Pure and stateless.
 *
 * JPEG and WebP are searchable. PNG is lossless, so the orchestrator
 * must do one best-effort encode and report the size it got.
 */
[[nodiscard]] constexpr SearchApplicability select_strategy(const OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Jpeg:
        case OutputFormat::Webp:
            return SearchApplicability::Searchable;
        case OutputFormat::Png:
            return SearchApplicability::NotSearchable;
    }
    return SearchApplicability::NotSearchable;
}

[[nodiscard]] constexpr std::string_view to_string(const SearchApplicability applicability) noexcept {
    return applicability == SearchApplicability::Searchable ? "searchable" : "not-searchable";
}

} // namespace kbfit

#endif // KBFIT_FORMAT_STRATEGY_HPP
