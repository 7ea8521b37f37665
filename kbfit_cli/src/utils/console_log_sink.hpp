#ifndef KBFIT_CONSOLE_LOG_SINK_HPP
#define KBFIT_CONSOLE_LOG_SINK_HPP

#include "../../../libkbfit/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Writes messages at or above log_level to the terminal.
 *
 * Debug and Info go to stdout, Warning and Error to stderr.
 */
class ConsoleLogSink final : public kbfit::ILogSink {
public:
    kbfit::LogLevel log_level = kbfit::LogLevel::Warning;

    void log(const kbfit::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level == kbfit::LogLevel::None || level < log_level) {
            return;
        }
        switch (level) {
            case kbfit::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case kbfit::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case kbfit::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case kbfit::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
            case kbfit::LogLevel::None:
                break;
        }
    }
};

#endif // KBFIT_CONSOLE_LOG_SINK_HPP
