/**
 * @file png_codec.hpp
 * @brief Defines the ICodec implementation for PNG output using libpng.
 */

#ifndef KBFIT_PNG_CODEC_HPP
#define KBFIT_PNG_CODEC_HPP

#include "codec.hpp"
#include <cstdint>
#include <span>

namespace kbfit {

    /**
     * @brief Implements ICodec for PNG files using libpng.
     *
     * @details PNG is lossless and has no size-correlated quality knob,
     * so the quality argument is ignored. The encoder analyses the
     * pixels and picks the smallest colour type that represents them
     * exactly (palette, grayscale, grayscale+alpha, RGB or RGBA), then
     * writes with zlib level 9 and all row filters enabled.
     */
    class PngCodec final : public ICodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] OutputFormat get_format() const noexcept override {
            return OutputFormat::Png;
        }

        // --- capabilities ---
        [[nodiscard]] bool has_quality_knob() const noexcept override { return false; }

        // --- operations ---

        /**
         * @brief Losslessly encodes an image to PNG.
         * @param image Source raster (RGB or RGBA).
         * @param quality Ignored.
         * @return The PNG file bytes.
         * @throws CodecFailure if libpng reports an error.
         */
        [[nodiscard]] std::vector<uint8_t> encode(const Image& image, int quality) const override;
    };

    /**
     * @brief Decodes a PNG file held in memory.
     *
     * 16-bit samples are stripped to 8 bits, palettes and low bit depths
     * expanded, tRNS converted to alpha and gray expanded to RGB.
     *
     * @param data The PNG file bytes.
     * @return RGBA image if the source carries alpha, RGB otherwise.
     * @throws CodecFailure on a bad signature or a libpng error.
     */
    Image decode_png(std::span<const uint8_t> data);

} // namespace kbfit

#endif // KBFIT_PNG_CODEC_HPP
