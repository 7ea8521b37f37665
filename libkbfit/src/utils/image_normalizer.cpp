/**
 * @file image_normalizer.cpp
 * @brief Alpha flattening and colour parsing.
 */

#include "../../include/image_normalizer.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string>

namespace {

int hex_value(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

uint8_t blend(const uint8_t src, const uint8_t bg, const uint8_t alpha) {
    const unsigned a = alpha;
    return static_cast<uint8_t>((src * a + bg * (255u - a) + 127u) / 255u);
}

struct NamedColor {
    std::string_view name;
    kbfit::Rgb rgb;
};

constexpr std::array<NamedColor, 7> kNamedColors = {{
    {"white", {255, 255, 255}},
    {"black", {0, 0, 0}},
    {"red",   {255, 0, 0}},
    {"green", {0, 128, 0}},
    {"blue",  {0, 0, 255}},
    {"gray",  {128, 128, 128}},
    {"grey",  {128, 128, 128}},
}};

} // namespace

namespace kbfit {

Image flatten_alpha(const Image& image, const Rgb background) {
    if (!image.has_alpha()) {
        return image;
    }

    Image out;
    out.width = image.width;
    out.height = image.height;
    out.channels = 3;
    const std::size_t count = static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height);
    out.pixels.resize(count * 3);

    const uint8_t *src = image.pixels.data();
    uint8_t *dst = out.pixels.data();
    for (std::size_t i = 0; i < count; ++i, src += 4, dst += 3) {
        const uint8_t a = src[3];
        dst[0] = blend(src[0], background.r, a);
        dst[1] = blend(src[1], background.g, a);
        dst[2] = blend(src[2], background.b, a);
    }
    return out;
}

Image normalize_for_output(Image image, const OutputFormat format, const Rgb background) {
    switch (format) {
        case OutputFormat::Jpeg:
            if (image.has_alpha()) {
                Logger::log(LogLevel::Info, "Flattening alpha channel for JPEG output", "normalizer");
                return flatten_alpha(image, background);
            }
            return image;
        case OutputFormat::Webp:
        case OutputFormat::Png:
            return image;
    }
    return image;
}

Rgb parse_color(const std::string_view text) {
    std::string s(text);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [name, rgb] : kNamedColors) {
        if (s == name) return rgb;
    }

    if (!s.empty() && s.front() == '#') {
        const std::string_view hex = std::string_view(s).substr(1);
        const bool all_hex = std::ranges::all_of(hex, [](const char c) { return hex_value(c) >= 0; });
        if (all_hex && hex.size() == 3) {
            return {static_cast<uint8_t>(hex_value(hex[0]) * 17),
                    static_cast<uint8_t>(hex_value(hex[1]) * 17),
                    static_cast<uint8_t>(hex_value(hex[2]) * 17)};
        }
        if (all_hex && hex.size() == 6) {
            return {static_cast<uint8_t>(hex_value(hex[0]) * 16 + hex_value(hex[1])),
                    static_cast<uint8_t>(hex_value(hex[2]) * 16 + hex_value(hex[3])),
                    static_cast<uint8_t>(hex_value(hex[4]) * 16 + hex_value(hex[5]))};
        }
    }

    throw std::invalid_argument("unknown color specifier: '" + std::string(text) + "'");
}

} // namespace kbfit
