/**
 * @file codec_registry.cpp
 * @brief Implementation of CodecRegistry.
 */

#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace kbfit {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
}

void CodecRegistry::register_codec(std::unique_ptr<ICodec> codec) {
    if (!codec) return;
    Logger::log(LogLevel::Debug,
                "Registering " + std::string(codec->get_name()) + " for " +
                std::string(to_string(codec->get_format())),
                "codec_registry");
    codecs_.insert(codecs_.begin(), std::move(codec));
}

const ICodec* CodecRegistry::find_by_format(const OutputFormat format) const {
    for (const auto& codec : codecs_) {
        if (codec->get_format() == format) {
            return codec.get();
        }
    }
    return nullptr;
}

} // namespace kbfit
