#include "cli_parser.hpp"
#include "../../../libkbfit/include/file_utils.hpp"
#include "../../../libkbfit/include/image_normalizer.hpp"
#include <CLI/CLI.hpp>
#include <limits>
#include <stdexcept>

namespace {
// helper for validating output format string
struct OutputFormatValidator : CLI::Validator {
    OutputFormatValidator() {
        name_ = "FORMAT";
        func_ = [](const std::string& str) {
            if (!kbfit::parse_output_format(str).has_value()) {
                return std::string("Invalid format: '") + str + "'. Must be one of: jpg, jpeg, webp, png.";
            }
            return std::string(); // ok
        };
    }
};

// helper for validating the --bg colour string
struct ColorValidator : CLI::Validator {
    ColorValidator() {
        name_ = "COLOR";
        func_ = [](const std::string& str) {
            try {
                (void)kbfit::parse_color(str);
            } catch (const std::invalid_argument& e) {
                return std::string(e.what()) + ". Use #rgb, #rrggbb or a basic colour name.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("--force", settings.force,
                 "Write the min-quality result even when it exceeds the target.");

    app.add_flag("--probe-bounds", settings.probe_bounds,
                 "Probe max and min quality before bisecting.");

    app.add_flag("--dry-run", settings.dry_run,
                 "Run the search without writing the output file.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (log messages, summary).");

    // --- Required options ---
    app.add_option("-i,--input", settings.input, "Input image (JPEG, PNG or WebP).")
        ->required()
        ->check(CLI::ExistingFile);

    constexpr std::uintmax_t max_kb = std::numeric_limits<std::uintmax_t>::max() / 1024;
    app.add_option("-t,--target-kb", settings.target_kb,
                   "Maximum output size in KB (1 KB = 1024 bytes).")
        ->required()
        ->check(CLI::Range(std::uintmax_t{1}, max_kb));

    app.add_option("-f,--format,--out-fmt", settings.format_name, "Output format: jpg, webp or png.")
        ->required()
        ->check(OutputFormatValidator());

    // --- Optional settings ---
    app.add_option("-o,--output-dir,--out-dir", settings.output_dir,
                   "Directory for <stem>_out.<ext>; created if missing.")
        ->default_val("output");

    app.add_option("--min-quality,--q-min", settings.min_quality,
                   "Lowest quality the search may use.")
        ->default_val(settings.min_quality)
        ->check(CLI::Range(kbfit::kMinQuality, kbfit::kMaxQuality));

    app.add_option("--max-quality,--q-max", settings.max_quality,
                   "Highest quality the search may use.")
        ->default_val(settings.max_quality)
        ->check(CLI::Range(kbfit::kMinQuality, kbfit::kMaxQuality));

    app.add_option("--bg", settings.background,
                   "Background colour for flattening transparency into JPEG.")
        ->default_val("#ffffff")
        ->check(ColorValidator());

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last(); // if used multiple times, take the last one

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("WARNING")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        settings.format = kbfit::parse_output_format(settings.format_name).value_or(kbfit::OutputFormat::Jpeg);

        // never write next to the input
        if (kbfit::same_directory(settings.input.has_parent_path() ? settings.input.parent_path()
                                                                   : std::filesystem::path("."),
                                  settings.output_dir)) {
            throw CLI::ValidationError("--output-dir must differ from the input file's directory.");
        }

        if (!settings.report_path.empty()) {
            const auto out = kbfit::build_output_path(settings.input, settings.output_dir, settings.format);
            if (std::filesystem::absolute(settings.report_path).lexically_normal() ==
                std::filesystem::absolute(out).lexically_normal()) {
                throw CLI::ValidationError("--report would overwrite the output image.");
            }
        }
    });
}
