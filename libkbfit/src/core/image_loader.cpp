/**
 * @file image_loader.cpp
 */

#include "../../include/image_loader.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/output_format.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <string>

namespace kbfit {

Image load_image_from_memory(const std::span<const uint8_t> data, const std::filesystem::path& name_hint) {
    if (data.empty()) {
        throw CodecFailure("empty input" + (name_hint.empty() ? std::string() : ": " + name_hint.string()));
    }

    const std::string mime = MimeDetector::detect(data, name_hint);
    Logger::log(LogLevel::Debug, "Detected input type " + mime, "image_loader");

    Image image;
    if (mime == mime_for(OutputFormat::Jpeg)) {
        image = decode_jpeg(data);
    } else if (mime == mime_for(OutputFormat::Png)) {
        image = decode_png(data);
    } else if (mime == mime_for(OutputFormat::Webp) || mime == "image/x-webp") {
        image = decode_webp(data);
    } else {
        Logger::log(LogLevel::Error, "Unsupported input type: " + mime, "image_loader");
        throw CodecFailure("unsupported input type: " + mime);
    }

    Logger::log(LogLevel::Info,
                "Loaded " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                (image.has_alpha() ? " RGBA" : " RGB") + " image",
                "image_loader");
    return image;
}

Image load_image(const std::filesystem::path& path) {
    const std::vector<uint8_t> data = read_file(path);
    return load_image_from_memory(data, path);
}

} // namespace kbfit
