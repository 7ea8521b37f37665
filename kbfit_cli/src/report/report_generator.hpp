#ifndef KBFIT_REPORT_GENERATOR_HPP
#define KBFIT_REPORT_GENERATOR_HPP

#include "../../../libkbfit/include/search_types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct Result {
    std::filesystem::path input;        // source image
    std::filesystem::path output;       // written file, empty if none
    std::string format;                 // "jpg", "webp", "png"
    uintmax_t size_before{};            // input size in bytes
    uintmax_t size_after{};             // chosen encoding size in bytes
    uintmax_t target{};                 // byte budget
    std::optional<int> quality;         // absent for png or on failure
    std::string reason;                 // terminal reason
    std::size_t iterations{};           // number of encodes
    int width{};
    int height{};
    bool meets_target{};
    bool written{};                     // output file was written
    bool success{};                     // exit status is 0
    double seconds{};                   // processing time
    std::vector<kbfit::ProbeRecord> trail;
    std::string error_msg;              // if !success, reason of failure
};

/**
 * @brief Status word shown in the Result column ("OK", "FORCED", ...).
 */
std::string outcome_label(const Result& r);

/**
 * @brief Quote a CSV field if it contains a comma, quote or newline.
 */
std::string csv_escape(const std::string& field);

/**
 * @brief Format a trail as "q=60:81234<=; q=77:99012>" for reports.
 */
std::string format_trail(const std::vector<kbfit::ProbeRecord>& trail);

void print_console_report(const Result& result);

/**
 * @brief Write a header and one row for result.
 * @return False if the file could not be written.
 */
bool export_csv_report(const Result& result, const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif // KBFIT_REPORT_GENERATOR_HPP
