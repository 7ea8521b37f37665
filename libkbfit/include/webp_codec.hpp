/**
 * @file webp_codec.hpp
 * @brief Defines the ICodec implementation for WebP output.
 */

#ifndef KBFIT_WEBP_CODEC_HPP
#define KBFIT_WEBP_CODEC_HPP

#include "codec.hpp"
#include <cstdint>
#include <span>

namespace kbfit {

    /**
     * @brief Implements ICodec for lossy WebP using libwebp.
     *
     * @details Uses the default preset at the requested quality. RGBA
     * input keeps its alpha plane.
     */
    class WebpCodec final : public ICodec {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpCodec";
        }

        [[nodiscard]] OutputFormat get_format() const noexcept override {
            return OutputFormat::Webp;
        }

        // --- capabilities ---
        [[nodiscard]] bool has_quality_knob() const noexcept override { return true; }

        // --- operations ---

        /**
         * @brief Encodes an RGB or RGBA image to lossy WebP.
         * @param image Source raster.
         * @param quality libwebp quality factor, clamped to [0, 100].
         * @return The WebP (RIFF) file bytes.
         * @throws CodecFailure if libwebp init, import or encode fails.
         */
        [[nodiscard]] std::vector<uint8_t> encode(const Image& image, int quality) const override;
    };

    /**
     * @brief Decodes a WebP file held in memory.
     * @param data The WebP file bytes.
     * @return RGBA image if the bitstream has alpha, RGB otherwise.
     * @throws CodecFailure if feature detection or decoding fails.
     */
    Image decode_webp(std::span<const uint8_t> data);

} // namespace kbfit

#endif // KBFIT_WEBP_CODEC_HPP
