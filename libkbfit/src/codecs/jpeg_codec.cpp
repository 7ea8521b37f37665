/**
 * @file jpeg_codec.cpp
 * @brief libjpeg encode/decode for JPEG.
 */

#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    kbfit::Logger::log(kbfit::LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Silences libjpeg's corrupt-data warnings on stderr, forwarding them to the logger.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    kbfit::Logger::log(kbfit::LogLevel::Warning, std::string("libjpeg: ") + buffer, "libjpeg");
}

/**
 * @brief Frees the buffer jpeg_mem_dest allocates.
 */
struct MemDestBuffer {
    unsigned char *data = nullptr;
    unsigned long size = 0;

    ~MemDestBuffer() { std::free(data); }
};

} // namespace

namespace kbfit {

std::vector<uint8_t> JpegCodec::encode(const Image& image, const int quality) const {
    if (image.empty()) {
        throw CodecFailure("JpegCodec: cannot encode an empty image");
    }
    if (image.channels != 3) {
        Logger::log(LogLevel::Error,
                    "JpegCodec: expected 3 channels, got " + std::to_string(image.channels),
                    "jpeg_codec");
        throw CodecFailure("JpegCodec: unsupported channel count (flatten alpha before encoding)");
    }

    const int q = std::clamp(quality, 1, 100);

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    // error handlers must be set before any possible error
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    MemDestBuffer out;

    try {
        jpeg_create_compress(&cinfo);
        jpeg_mem_dest(&cinfo, &out.data, &out.size);

        cinfo.image_width = static_cast<JDIMENSION>(image.width);
        cinfo.image_height = static_cast<JDIMENSION>(image.height);
        cinfo.input_components = 3;
        cinfo.in_color_space = JCS_RGB;

        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, q, TRUE);
        cinfo.optimize_coding = TRUE;

        jpeg_start_compress(&cinfo, TRUE);

        const std::size_t row_stride = image.stride();
        while (cinfo.next_scanline < cinfo.image_height) {
            auto *row = const_cast<JSAMPROW>(image.pixels.data() + cinfo.next_scanline * row_stride);
            jpeg_write_scanlines(&cinfo, &row, 1);
        }

        jpeg_finish_compress(&cinfo);
    } catch (const std::exception& e) {
        jpeg_destroy_compress(&cinfo);
        Logger::log(LogLevel::Error,
                    "JPEG encode failed at quality " + std::to_string(q) + ": " + e.what(),
                    "jpeg_codec");
        throw CodecFailure(std::string("JpegCodec: ") + e.what());
    }

    std::vector<uint8_t> bytes(out.data, out.data + out.size);
    jpeg_destroy_compress(&cinfo);

    Logger::log(LogLevel::Debug,
                "JPEG q=" + std::to_string(q) + " -> " + std::to_string(bytes.size()) + " bytes",
                "jpeg_codec");
    return bytes;
}

Image decode_jpeg(const std::span<const uint8_t> data) {
    if (data.empty()) {
        throw CodecFailure("decode_jpeg: empty input");
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    Image image;
    try {
        jpeg_create_decompress(&cinfo);
        jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));

        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
            throw std::runtime_error("unsupported color mode (CMYK)");
        }
        cinfo.out_color_space = JCS_RGB;

        jpeg_start_decompress(&cinfo);

        image.width = static_cast<int>(cinfo.output_width);
        image.height = static_cast<int>(cinfo.output_height);
        image.channels = static_cast<int>(cinfo.output_components); // 3 after JCS_RGB
        if (image.channels != 3) {
            throw std::runtime_error("unexpected component count " + std::to_string(image.channels));
        }

        image.pixels.resize(image.stride() * static_cast<std::size_t>(image.height));
        const std::size_t row_stride = image.stride();
        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW row = image.pixels.data() + cinfo.output_scanline * row_stride;
            jpeg_read_scanlines(&cinfo, &row, 1);
        }

        jpeg_finish_decompress(&cinfo);
        jpeg_destroy_decompress(&cinfo);
    } catch (const std::exception& e) {
        jpeg_destroy_decompress(&cinfo);
        Logger::log(LogLevel::Error, std::string("JPEG decode failed: ") + e.what(), "jpeg_codec");
        throw CodecFailure(std::string("decode_jpeg: ") + e.what());
    }

    Logger::log(LogLevel::Debug,
                "Decoded JPEG " + std::to_string(image.width) + "x" + std::to_string(image.height),
                "jpeg_codec");
    return image;
}

} // namespace kbfit
