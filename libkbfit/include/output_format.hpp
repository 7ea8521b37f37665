/**
 * @file output_format.hpp
 * @brief Defines the output format tag and its string/extension/MIME mappings.
 *
 * OutputFormat is the closed set of formats kbfit can write. Every
 * dispatch on it is an exhaustive switch, so adding a format is caught
 * by the compiler at each site that needs updating.
 */

#ifndef KBFIT_OUTPUT_FORMAT_HPP
#define KBFIT_OUTPUT_FORMAT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kbfit {

/**
 * @brief Formats kbfit can encode.
 */
enum class OutputFormat {
    Jpeg,
    Webp,
    Png
};

/**
 * @brief Lowercase short name ("jpg", "webp", "png"), as used on the CLI.
 */
std::string_view to_string(OutputFormat fmt) noexcept;

/**
 * @brief File extension including the dot (e.g. ".jpg").
 */
std::string_view extension_for(OutputFormat fmt) noexcept;

/**
 * @brief Primary MIME type (e.g. "image/jpeg").
 */
std::string_view mime_for(OutputFormat fmt) noexcept;

/**
 * @brief Parses a format name or extension into an OutputFormat.
 *
 * Case-insensitive, leading dot optional. Accepts "jpg", "jpeg", "jpe",
 * "webp" and "png".
 *
 * @param str The string to parse.
 * @return The format, or std::nullopt if unknown.
 */
std::optional<OutputFormat> parse_output_format(std::string_view str);

///< Map linking lowercase file extensions to the MIME type of readable inputs.
inline const std::unordered_map<std::string, std::string> ext_to_mime = {
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".jpe",  "image/jpeg"},
    {".png",  "image/png"},
    {".webp", "image/webp"},
};

} // namespace kbfit

#endif // KBFIT_OUTPUT_FORMAT_HPP
