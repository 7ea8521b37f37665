#include <chrono>
#include <clocale>
#include <filesystem>
#include <iostream>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "cli/exit_policy.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libkbfit/include/compressor.hpp"
#include "../../libkbfit/include/errors.hpp"
#include "../../libkbfit/include/event_bus.hpp"
#include "../../libkbfit/include/events.hpp"
#include "../../libkbfit/include/file_utils.hpp"
#include "../../libkbfit/include/image_normalizer.hpp"
#include "../../libkbfit/include/logger.hpp"

using namespace kbfit;
namespace fs = std::filesystem;

namespace {

void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Warning: cannot open log file " << settings.log_file.string()
                      << RESET << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }

    // errors always reach the terminal, even with --quiet
    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    Logger::add_sink(std::move(consoleSink));
}

// prints and exports the report; returns the exit code adjusted for a failed export
int finish_report(const Settings& settings, Result& result,
                  const std::chrono::steady_clock::time_point start, const int exit_code) {
    result.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (!settings.quiet) {
        print_console_report(result);
    }
    bool report_ok = true;
    if (!settings.report_path.empty()) {
        report_ok = export_csv_report(result, settings.report_path);
    }
    return merge_report_status(exit_code, report_ok);
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"kbfit: compress an image to fit a size budget at the highest quality."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    setup_logging(settings);
    init_utf8_locale();

    const auto start_total = std::chrono::steady_clock::now();
    const fs::path output_path = build_output_path(settings.input, settings.output_dir, settings.format);

    CompressionRequest request;
    request.input = settings.input;
    request.target_max_bytes = settings.target_max_bytes();
    request.format = settings.format;
    request.bounds = settings.bounds();
    request.background = parse_color(settings.background);
    request.probe_bounds_first = settings.probe_bounds;

    Result report;
    report.input = settings.input;
    report.format = std::string(to_string(settings.format));
    report.target = request.target_max_bytes;
    {
        std::error_code ec;
        report.size_before = fs::file_size(settings.input, ec);
        if (ec) report.size_before = 0;
    }

    Compressor compressor;

    // show every probe as it happens
    if (!settings.quiet) {
        compressor.events().subscribe<ProbeEvent>([](const ProbeEvent& e) {
            std::cerr << (e.feasible ? GREEN : YELLOW)
                      << "[PROBE] q=" << e.quality << " -> " << e.size << " bytes"
                      << (e.feasible ? " (fits)" : " (over)")
                      << RESET << std::endl;
        });
    }

    CompressionResult result;
    try {
        result = compressor.compress(request);
    } catch (const InvalidBounds& e) {
        Logger::log(LogLevel::Error, std::string("Invalid request: ") + e.what(), "main");
        report.error_msg = e.what();
        return finish_report(settings, report, start_total, kExitInvalidRequest);
    } catch (const EncodingError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        report.error_msg = e.what();
        return finish_report(settings, report, start_total, kExitEncodingError);
    } catch (const CodecFailure& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        report.error_msg = e.what();
        return finish_report(settings, report, start_total, kExitEncodingError);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        report.error_msg = e.what();
        return finish_report(settings, report, start_total, kExitIoError);
    }

    report.size_after = result.size();
    report.quality = result.quality;
    report.reason = std::string(to_string(result.reason));
    report.iterations = result.iterations;
    report.width = result.width;
    report.height = result.height;
    report.meets_target = result.meets_target;
    report.trail = result.trail;

    const WriteDecision decision = decide_write(result.reason, settings.force);
    int exit_code = decision.exit_code;
    if (result.reason == TerminalReason::InfeasibleAtMinimum) {
        const std::string msg = "Cannot reach " + std::to_string(request.target_max_bytes) +
                                " bytes: quality " + std::to_string(result.quality.value_or(0)) +
                                " still produces " + std::to_string(result.size()) + " bytes";
        if (decision.write) {
            Logger::log(LogLevel::Warning, msg + "; writing it anyway (--force)", "main");
        } else {
            Logger::log(LogLevel::Error, msg + ". Raise --target-kb or lower --min-quality.", "main");
            report.error_msg = msg;
        }
    }

    if (decision.write && !settings.dry_run) {
        try {
            write_file(output_path, result.bytes);
            report.output = output_path;
            report.written = true;
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Cannot write output: ") + e.what(), "main");
            report.error_msg = e.what();
            exit_code = kExitIoError;
        }
    } else if (decision.write) {
        Logger::log(LogLevel::Info, "Dry run: not writing " + output_path.string(), "main");
    }

    report.success = exit_code == kExitOk;
    return finish_report(settings, report, start_total, exit_code);
}
