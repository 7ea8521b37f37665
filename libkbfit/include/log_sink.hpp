/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef KBFIT_LOG_SINK_HPP
#define KBFIT_LOG_SINK_HPP

#include <string_view>

namespace kbfit {

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from most to least verbose, so sinks can filter with a
 * simple threshold comparison.
 */
enum class LogLevel {
    Debug,   ///< Per-probe details, codec parameters
    Info,    ///< Normal progress (search started, result chosen)
    Warning, ///< Target missed, forced output, recoverable codec warnings
    Error,   ///< Failures that abort the current request
    None     ///< Threshold only: suppresses everything
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, observer).
 * Logger fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "jpeg_codec").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace kbfit

#endif // KBFIT_LOG_SINK_HPP
