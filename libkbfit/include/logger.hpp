/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for all logging in kbfit. It
 * delegates messages to every registered ILogSink.
 */

#ifndef KBFIT_LOGGER_HPP
#define KBFIT_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kbfit {

/**
 * @brief Static logging facade.
 *
 * Holds no search state; concurrent compressions on different threads
 * may log through it safely.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Detach and destroy a sink previously added with add_sink().
     * Unknown pointers are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "kbfit").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "kbfit");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Converts a level name to its LogLevel.
     * Case-insensitive. Accepts "WARN" and "WARNING". Returns
     * LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace kbfit

#endif // KBFIT_LOGGER_HPP
