/**
 * @file output_format.cpp
 * @brief OutputFormat conversions.
 */

#include "../../include/output_format.hpp"
#include <algorithm>
#include <cctype>

namespace kbfit {

std::string_view to_string(const OutputFormat fmt) noexcept {
    switch (fmt) {
        case OutputFormat::Jpeg: return "jpg";
        case OutputFormat::Webp: return "webp";
        case OutputFormat::Png:  return "png";
    }
    return "unknown";
}

std::string_view extension_for(const OutputFormat fmt) noexcept {
    switch (fmt) {
        case OutputFormat::Jpeg: return ".jpg";
        case OutputFormat::Webp: return ".webp";
        case OutputFormat::Png:  return ".png";
    }
    return "";
}

std::string_view mime_for(const OutputFormat fmt) noexcept {
    switch (fmt) {
        case OutputFormat::Jpeg: return "image/jpeg";
        case OutputFormat::Webp: return "image/webp";
        case OutputFormat::Png:  return "image/png";
    }
    return "application/octet-stream";
}

std::optional<OutputFormat> parse_output_format(const std::string_view str) {
    std::string s(str);
    if (!s.empty() && s.front() == '.') {
        s.erase(0, 1);
    }
    std::ranges::transform(s, s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "jpg" || s == "jpeg" || s == "jpe") return OutputFormat::Jpeg;
    if (s == "webp") return OutputFormat::Webp;
    if (s == "png")  return OutputFormat::Png;
    return std::nullopt;
}

} // namespace kbfit
