#ifndef KBFIT_CLI_PARSER_HPP
#define KBFIT_CLI_PARSER_HPP

#include "../../../libkbfit/include/output_format.hpp"
#include "../../../libkbfit/include/search_types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool force = false;
    bool probe_bounds = false;
    bool dry_run = false;
    bool quiet = false;

    std::filesystem::path input;
    std::uintmax_t target_kb = 0;
    std::string format_name;
    kbfit::OutputFormat format = kbfit::OutputFormat::Jpeg; // resolved from format_name
    std::filesystem::path output_dir = "output";
    int min_quality = kbfit::QualityBounds{}.min_quality;
    int max_quality = kbfit::QualityBounds{}.max_quality;
    std::string background = "#ffffff";

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    [[nodiscard]] std::uintmax_t target_max_bytes() const { return target_kb * 1024; }
    [[nodiscard]] kbfit::QualityBounds bounds() const { return {min_quality, max_quality}; }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // KBFIT_CLI_PARSER_HPP
