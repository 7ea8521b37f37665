/**
 * @file image.hpp
 * @brief In-memory raster passed between the loader, normalizer and codecs.
 */

#ifndef KBFIT_IMAGE_HPP
#define KBFIT_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kbfit {

/**
 * @brief Interleaved 8-bit image, either RGB (3 channels) or RGBA (4).
 *
 * Rows are tightly packed: stride is width * channels.
 */
struct Image {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<uint8_t> pixels;

    [[nodiscard]] bool has_alpha() const noexcept { return channels == 4; }

    [[nodiscard]] std::size_t stride() const noexcept {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(channels);
    }

    [[nodiscard]] bool empty() const noexcept {
        return width <= 0 || height <= 0 || pixels.empty();
    }
};

/**
 * @brief An opaque 8-bit colour, used as the flattening background.
 */
struct Rgb {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;

    bool operator==(const Rgb&) const = default;
};

} // namespace kbfit

#endif // KBFIT_IMAGE_HPP
