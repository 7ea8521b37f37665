/**
 * @file webp_codec.cpp
 * @brief libwebp encode/decode for WebP.
 */

#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <algorithm>
#include <string>

namespace {

/**
 * @brief RAII owner for a WebPPicture and the memory writer it feeds.
 */
struct WebpEncodeState {
    WebPPicture picture{};
    WebPMemoryWriter writer{};
    bool picture_ready = false;

    WebpEncodeState() { WebPMemoryWriterInit(&writer); }

    ~WebpEncodeState() {
        if (picture_ready) WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
    }
};

} // namespace

namespace kbfit {

std::vector<uint8_t> WebpCodec::encode(const Image& image, const int quality) const {
    if (image.empty()) {
        throw CodecFailure("WebpCodec: cannot encode an empty image");
    }
    if (image.channels != 3 && image.channels != 4) {
        throw CodecFailure("WebpCodec: unsupported channel count " + std::to_string(image.channels));
    }

    const auto q = static_cast<float>(std::clamp(quality, 0, 100));

    WebPConfig config;
    if (!WebPConfigPreset(&config, WEBP_PRESET_DEFAULT, q)) {
        Logger::log(LogLevel::Error, "WebpCodec: WebPConfigPreset failed", "webp_codec");
        throw CodecFailure("WebpCodec: WebPConfigPreset failed");
    }
    config.lossless = 0;
    if (!WebPValidateConfig(&config)) {
        Logger::log(LogLevel::Error, "WebpCodec: invalid config", "webp_codec");
        throw CodecFailure("WebpCodec: WebPValidateConfig failed");
    }

    WebpEncodeState state;
    if (!WebPPictureInit(&state.picture)) {
        Logger::log(LogLevel::Error, "WebpCodec: WebPPictureInit failed", "webp_codec");
        throw CodecFailure("WebpCodec: WebPPictureInit failed");
    }
    state.picture_ready = true;
    state.picture.use_argb = 0;
    state.picture.width = image.width;
    state.picture.height = image.height;

    const int stride = static_cast<int>(image.stride());
    const int imported = image.has_alpha()
        ? WebPPictureImportRGBA(&state.picture, image.pixels.data(), stride)
        : WebPPictureImportRGB(&state.picture, image.pixels.data(), stride);
    if (!imported) {
        Logger::log(LogLevel::Error, "WebpCodec: picture import failed", "webp_codec");
        throw CodecFailure("WebpCodec: picture import failed");
    }

    state.picture.writer = WebPMemoryWrite;
    state.picture.custom_ptr = &state.writer;

    if (!WebPEncode(&config, &state.picture)) {
        Logger::log(LogLevel::Error,
                    "WebpCodec: WebPEncode failed (error " + std::to_string(state.picture.error_code) + ")",
                    "webp_codec");
        throw CodecFailure("WebpCodec: WebPEncode failed");
    }

    std::vector<uint8_t> bytes(state.writer.mem, state.writer.mem + state.writer.size);
    Logger::log(LogLevel::Debug,
                "WebP q=" + std::to_string(static_cast<int>(q)) + " -> " + std::to_string(bytes.size()) + " bytes",
                "webp_codec");
    return bytes;
}

Image decode_webp(const std::span<const uint8_t> data) {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        Logger::log(LogLevel::Error, "decode_webp: feature detection failed", "webp_codec");
        throw CodecFailure("decode_webp: feature detection failed");
    }

    int width = 0, height = 0;
    uint8_t* decoded = features.has_alpha
        ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
        : WebPDecodeRGB(data.data(), data.size(), &width, &height);
    if (!decoded) {
        Logger::log(LogLevel::Error, "decode_webp: decode failed", "webp_codec");
        throw CodecFailure("decode_webp: decode failed");
    }

    Image image;
    image.width = width;
    image.height = height;
    image.channels = features.has_alpha ? 4 : 3;
    image.pixels.assign(decoded, decoded + image.stride() * static_cast<std::size_t>(height));
    WebPFree(decoded);

    Logger::log(LogLevel::Debug,
                "Decoded WebP " + std::to_string(width) + "x" + std::to_string(height) +
                (features.has_alpha ? " (alpha)" : ""),
                "webp_codec");
    return image;
}

} // namespace kbfit
