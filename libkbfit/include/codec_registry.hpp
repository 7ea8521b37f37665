/**
 * @file codec_registry.hpp
 * @brief Defines the registry that owns ICodec instances.
 */

#ifndef KBFIT_CODEC_REGISTRY_HPP
#define KBFIT_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <memory>
#include <vector>

namespace kbfit {

/**
 * @brief Registry of available codecs.
 *
 * @details Owns one codec per output format. The constructor registers
 * the built-in libjpeg, libwebp and libpng codecs; register_codec()
 * lets a caller shadow any of them (tests install synthetic codecs this
 * way). The registry is instantiated once per Compressor.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register all built-in codecs.
     */
    CodecRegistry();

    /**
     * @brief Add a codec. It takes precedence over any codec already
     * registered for the same format.
     * @param codec The codec to own. Null pointers are ignored.
     */
    void register_codec(std::unique_ptr<ICodec> codec);

    /**
     * @brief Find the codec for a format.
     * @param format The output format.
     * @return Non-owning pointer, or nullptr if no codec handles the format.
     */
    [[nodiscard]] const ICodec* find_by_format(OutputFormat format) const;

    /**
     * @brief Access all registered codecs, most recent first.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<ICodec>>& all() const { return codecs_; }

private:
    ///< Owned codecs; lookups scan front to back.
    std::vector<std::unique_ptr<ICodec>> codecs_;
};

} // namespace kbfit

#endif // KBFIT_CODEC_REGISTRY_HPP
