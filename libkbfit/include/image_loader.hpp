/**
 * @file image_loader.hpp
 * @brief Decodes JPEG, PNG and WebP inputs into an Image.
 */

#ifndef KBFIT_IMAGE_LOADER_HPP
#define KBFIT_IMAGE_LOADER_HPP

#include "image.hpp"
#include <cstdint>
#include <filesystem>
#include <span>

namespace kbfit {

/**
 * @brief Load and decode an image file.
 *
 * The type is detected with MimeDetector, so a mislabelled extension
 * is handled as long as libmagic recognises the content.
 *
 * @return RGB or RGBA raster.
 * @throws std::runtime_error if the file is missing or unreadable.
 * @throws CodecFailure for corrupt data, unsupported types or colour modes.
 */
[[nodiscard]] Image load_image(const std::filesystem::path& path);

/**
 * @brief Decode an encoded image held in memory.
 *
 * @param data Encoded file bytes.
 * @param name_hint File name used if content sniffing fails.
 * @throws CodecFailure as load_image().
 */
[[nodiscard]] Image load_image_from_memory(std::span<const uint8_t> data,
                                           const std::filesystem::path& name_hint = {});

} // namespace kbfit

#endif // KBFIT_IMAGE_LOADER_HPP
