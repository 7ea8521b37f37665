/**
 * @file file_utils.hpp
 * @brief Whole-file I/O and output path helpers.
 */

#ifndef KBFIT_FILE_UTILS_HPP
#define KBFIT_FILE_UTILS_HPP

#include "output_format.hpp"
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace kbfit {

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file is missing or unreadable.
     */
    [[nodiscard]] std::vector<uint8_t> read_file(const std::filesystem::path &path);

    /**
     * @brief Writes bytes to a file, creating parent directories as needed.
     *
     * The data goes to a sibling temporary file that is renamed over the
     * destination, so a failed write never leaves a truncated output.
     *
     * @throws std::runtime_error on any I/O failure.
     */
    void write_file(const std::filesystem::path &path, std::span<const uint8_t> data);

    /**
     * @brief Output location for an input: "<out_dir>/<stem>_out.<ext>".
     */
    [[nodiscard]] std::filesystem::path build_output_path(const std::filesystem::path &input,
                                                          const std::filesystem::path &out_dir,
                                                          OutputFormat format);

    /**
     * @brief True if both paths name the same directory once resolved.
     *
     * Paths that do not exist yet are compared lexically after
     * normalization.
     */
    [[nodiscard]] bool same_directory(const std::filesystem::path &a, const std::filesystem::path &b);

} // namespace kbfit

#endif // KBFIT_FILE_UTILS_HPP
