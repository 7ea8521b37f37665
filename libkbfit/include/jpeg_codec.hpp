/**
 * @file jpeg_codec.hpp
 * @brief Defines the ICodec implementation for JPEG output.
 */

#ifndef KBFIT_JPEG_CODEC_HPP
#define KBFIT_JPEG_CODEC_HPP

#include "codec.hpp"
#include <cstdint>
#include <span>

namespace kbfit {

    /**
     * @brief Implements ICodec for JPEG using libjpeg.
     *
     * @details Performs a full in-memory baseline encode with the IJG
     * quality scaling and optimized Huffman tables. The quality knob is
     * the standard libjpeg 1-100 scale.
     */
    class JpegCodec final : public ICodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] OutputFormat get_format() const noexcept override {
            return OutputFormat::Jpeg;
        }

        // --- capabilities ---
        [[nodiscard]] bool has_quality_knob() const noexcept override { return true; }

        // --- operations ---

        /**
         * @brief Encodes an RGB image to JPEG.
         *
         * @param image Source raster. Must be 3-channel; RGBA input is
         * rejected because JPEG has no alpha (see normalize_for_output).
         * @param quality libjpeg quality, clamped to [1, 100].
         * @return The JPEG file bytes.
         * @throws CodecFailure on empty/RGBA input or a libjpeg error.
         */
        [[nodiscard]] std::vector<uint8_t> encode(const Image& image, int quality) const override;
    };

    /**
     * @brief Decodes a JPEG file held in memory into an RGB image.
     * @param data The JPEG file bytes.
     * @return Decoded 3-channel image (grayscale is expanded to RGB).
     * @throws CodecFailure on corrupt data or a CMYK/YCCK colour space.
     */
    Image decode_jpeg(std::span<const uint8_t> data);

} // namespace kbfit

#endif // KBFIT_JPEG_CODEC_HPP
