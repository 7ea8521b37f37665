/**
 * @file errors.hpp
 * @brief Exception types raised by the kbfit library.
 *
 * Only fatal conditions are exceptions. An infeasible target or a
 * format without a quality knob is reported through TerminalReason in
 * the search outcome instead.
 */

#ifndef KBFIT_ERRORS_HPP
#define KBFIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace kbfit {

/**
 * @brief A codec could not decode or encode an image.
 *
 * Raised by codec adapters and by the image loader for unreadable or
 * corrupt data and unsupported colour modes.
 */
class CodecFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A probe failed while searching, which aborts the search.
 */
class EncodingError : public std::runtime_error {
public:
    EncodingError(const int quality, const std::string& what)
        : std::runtime_error("encoding failed at quality " + std::to_string(quality) + ": " + what),
          quality_(quality) {}

    /// @return The quality value whose probe failed.
    [[nodiscard]] int quality() const noexcept { return quality_; }

private:
    int quality_;
};

/**
 * @brief The request was rejected before any probe was attempted.
 *
 * Raised for min_quality > max_quality, bounds outside [1, 100], or a
 * zero byte target.
 */
class InvalidBounds : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace kbfit

#endif // KBFIT_ERRORS_HPP
