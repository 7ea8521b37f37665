/**
 * @file image_normalizer.hpp
 * @brief Prepares a decoded image for a given output format.
 */

#ifndef KBFIT_IMAGE_NORMALIZER_HPP
#define KBFIT_IMAGE_NORMALIZER_HPP

#include "image.hpp"
#include "output_format.hpp"
#include <string_view>

namespace kbfit {

/**
 * @brief Make an image encodable in the target format.
 *
 * JPEG has no alpha channel: RGBA input is composited onto the
 * background and returned as RGB. PNG and WebP keep the image as is.
 *
 * @param image Decoded image (RGB or RGBA).
 * @param format Target format.
 * @param background Colour shown through transparent pixels.
 * @return The normalized image.
 */
[[nodiscard]] Image normalize_for_output(Image image, OutputFormat format, Rgb background);

/**
 * @brief Composite RGBA onto an opaque background, dropping alpha.
 *
 * out = (src * a + bg * (255 - a) + 127) / 255 per channel. RGB input
 * is returned unchanged.
 */
[[nodiscard]] Image flatten_alpha(const Image& image, Rgb background);

/**
 * @brief Parse a colour string.
 *
 * Accepts "#rgb", "#rrggbb" (case-insensitive hex) and the names
 * white, black, red, green, blue, gray and grey.
 *
 * @throws std::invalid_argument on anything else.
 */
[[nodiscard]] Rgb parse_color(std::string_view text);

} // namespace kbfit

#endif // KBFIT_IMAGE_NORMALIZER_HPP
