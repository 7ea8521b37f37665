/**
 * @file codec.hpp
 * @brief Defines the ICodec interface, the encoder seam of kbfit.
 */

#ifndef KBFIT_CODEC_HPP
#define KBFIT_CODEC_HPP

#include "image.hpp"
#include "output_format.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

/**
 * @namespace kbfit
 * @brief The main namespace for the kbfit library.
 *
 * @details Contains the codec adapters (ICodec and its libjpeg, libwebp
 * and libpng implementations), the quality search core
 * (FeasibilityOracle, search_max_quality, select_strategy), the
 * Compressor facade and the supporting utilities.
 */
namespace kbfit {

/**
 * @brief Interface for an image encoder.
 *
 * Each implementation targets exactly one OutputFormat. The search core
 * treats encode() as a black box and reasons only about the length of
 * the returned buffer.
 *
 * Implementations must be stateless across calls: encoding the same
 * image at the same quality must always produce the same bytes, which
 * is what makes the search deterministic.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "JpegCodec").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format this codec writes.
    [[nodiscard]] virtual OutputFormat get_format() const noexcept = 0;

    // --- capabilities ---

    /**
     * @return True if the quality argument of encode() changes the output size.
     *
     * Must match select_strategy() for get_format(); the Compressor
     * refuses a codec that disagrees.
     */
    [[nodiscard]] virtual bool has_quality_knob() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Encode an image.
     * @param image Source raster. Must not be empty.
     * @param quality Quality in [1, 100]. Ignored by codecs without a quality knob.
     * @return The encoded file bytes.
     * @throws CodecFailure if the underlying library rejects the image.
     */
    [[nodiscard]] virtual std::vector<uint8_t> encode(const Image& image, int quality) const = 0;
};

} // namespace kbfit

#endif // KBFIT_CODEC_HPP
