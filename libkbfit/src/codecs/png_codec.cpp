/**
 * @file png_codec.cpp
 * @brief libpng encode/decode for PNG.
 */

#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstring> // memcpy
#include <map>
#include <stdexcept>
#include <string>

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        kbfit::Logger::log(kbfit::LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        kbfit::Logger::log(kbfit::LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    // in-memory io
    struct MemoryReader {
        std::span<const uint8_t> data;
        std::size_t offset = 0;
    };

    void read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
        auto *reader = static_cast<MemoryReader *>(png_get_io_ptr(png));
        if (reader->offset + length > reader->data.size()) {
            png_error(png, "read past end of PNG data");
        }
        std::memcpy(out, reader->data.data() + reader->offset, length);
        reader->offset += length;
    }

    void write_to_vector(png_structp png, png_bytep data, const png_size_t length) {
        auto *out = static_cast<std::vector<uint8_t> *>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + length);
    }

    void flush_noop(png_structp) {}

    /**
     * @brief Packs RGBA color components into a single 32-bit integer.
     */
    inline uint32_t pack_rgba(const uint8_t r, const uint8_t g, const uint8_t b, const uint8_t a) {
        return (static_cast<uint32_t>(r) << 24) |
               (static_cast<uint32_t>(g) << 16) |
               (static_cast<uint32_t>(b) << 8)  |
               (static_cast<uint32_t>(a));
    }

    /**
     * @brief Result of scanning the pixels for the cheapest exact colour type.
     */
    struct PixelAnalysis {
        bool all_gray = true;
        bool all_opaque = true;
        bool can_use_palette = true;
        std::map<uint32_t, uint8_t> color_to_index;
        std::vector<png_color> palette;
        std::vector<png_byte> transparency;
    };

    PixelAnalysis analyze(const kbfit::Image& image) {
        PixelAnalysis a;
        const auto channels = static_cast<std::size_t>(image.channels);
        const std::size_t count = static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height);
        const uint8_t *p = image.pixels.data();

        for (std::size_t i = 0; i < count; ++i, p += channels) {
            const uint8_t r = p[0], g = p[1], b = p[2];
            const uint8_t alpha = image.has_alpha() ? p[3] : 0xFF;

            if (r != g || g != b) a.all_gray = false;
            if (alpha != 0xFF) a.all_opaque = false;

            if (a.can_use_palette) {
                const uint32_t color = pack_rgba(r, g, b, alpha);
                if (!a.color_to_index.contains(color)) {
                    if (a.color_to_index.size() >= 256) {
                        a.can_use_palette = false;
                    } else {
                        const auto index = static_cast<uint8_t>(a.color_to_index.size());
                        a.color_to_index[color] = index;
                        a.palette.push_back({r, g, b});
                        a.transparency.push_back(alpha);
                    }
                }
            }
        }
        return a;
    }

} // namespace

namespace kbfit {

    std::vector<uint8_t> PngCodec::encode(const Image& image, int /*quality*/) const {
        if (image.empty()) {
            throw CodecFailure("PngCodec: cannot encode an empty image");
        }
        if (image.channels != 3 && image.channels != 4) {
            throw CodecFailure("PngCodec: unsupported channel count " + std::to_string(image.channels));
        }

        const PixelAnalysis analysis = analyze(image);

        // determine optimal output format
        int out_color_type;
        if (analysis.can_use_palette) {
            out_color_type = PNG_COLOR_TYPE_PALETTE;
        } else if (analysis.all_gray && analysis.all_opaque) {
            out_color_type = PNG_COLOR_TYPE_GRAY;
        } else if (analysis.all_gray) {
            out_color_type = PNG_COLOR_TYPE_GA;
        } else if (analysis.all_opaque) {
            out_color_type = PNG_COLOR_TYPE_RGB;
        } else {
            out_color_type = PNG_COLOR_TYPE_RGBA;
        }

        std::vector<uint8_t> bytes;
        try {
            PngWrite wr;
            wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
            wr.info = png_create_info_struct(wr.png);
            if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

            png_set_write_fn(wr.png, &bytes, write_to_vector, flush_noop);

            // set max compression
            png_set_compression_level(wr.png, 9);
            png_set_compression_mem_level(wr.png, 9);
            png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
            png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

            const auto width = static_cast<png_uint_32>(image.width);
            const auto height = static_cast<png_uint_32>(image.height);
            png_set_IHDR(wr.png, wr.info, width, height, 8, out_color_type,
                         PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

            if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
                png_set_PLTE(wr.png, wr.info, analysis.palette.data(), static_cast<int>(analysis.palette.size()));
                // only write tRNS if there is actual transparency
                if (!analysis.all_opaque) {
                    png_set_tRNS(wr.png, wr.info, analysis.transparency.data(),
                                 static_cast<int>(analysis.transparency.size()), nullptr);
                }
            }

            png_write_info(wr.png, wr.info);

            const png_size_t out_channels = png_get_channels(wr.png, wr.info);
            std::vector<uint8_t> out_rowbuf(static_cast<std::size_t>(width) * out_channels);
            png_bytep out_row = out_rowbuf.data();
            const auto in_channels = static_cast<std::size_t>(image.channels);

            for (png_uint_32 y = 0; y < height; ++y) {
                const uint8_t *src = image.pixels.data() + y * image.stride();
                uint8_t *dst = out_row;

                for (png_uint_32 x = 0; x < width; ++x, src += in_channels) {
                    const uint8_t alpha = image.has_alpha() ? src[3] : 0xFF;
                    switch (out_color_type) {
                        case PNG_COLOR_TYPE_PALETTE:
                            *dst++ = analysis.color_to_index.at(pack_rgba(src[0], src[1], src[2], alpha));
                            break;
                        case PNG_COLOR_TYPE_GRAY:
                            *dst++ = src[0]; // r = g = b
                            break;
                        case PNG_COLOR_TYPE_GA:
                            *dst++ = src[0];
                            *dst++ = alpha;
                            break;
                        case PNG_COLOR_TYPE_RGB:
                            *dst++ = src[0];
                            *dst++ = src[1];
                            *dst++ = src[2];
                            break;
                        default: // RGBA
                            *dst++ = src[0];
                            *dst++ = src[1];
                            *dst++ = src[2];
                            *dst++ = alpha;
                            break;
                    }
                }

                png_write_rows(wr.png, &out_row, 1);
            }

            png_write_end(wr.png, wr.info);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("PNG encode failed: ") + e.what(), "png_codec");
            throw CodecFailure(std::string("PngCodec: ") + e.what());
        }

        Logger::log(LogLevel::Debug,
                    "PNG color type " + std::to_string(out_color_type) + " -> " +
                    std::to_string(bytes.size()) + " bytes",
                    "png_codec");
        return bytes;
    }

    Image decode_png(const std::span<const uint8_t> data) {
        if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
            throw CodecFailure("decode_png: not a PNG file");
        }

        Image image;
        try {
            PngRead rd;
            rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
            rd.info = png_create_info_struct(rd.png);
            if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

            MemoryReader reader{data, 0};
            png_set_read_fn(rd.png, &reader, read_from_memory);
            png_read_info(rd.png, rd.info);

            png_uint_32 width = 0, height = 0;
            int bit_depth = 0, color_type = 0;
            png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

            const bool has_trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
            const bool has_alpha = (color_type & PNG_COLOR_MASK_ALPHA) != 0 || has_trns;

            if (bit_depth == 16) png_set_strip_16(rd.png);
            if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
            if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
            if (has_trns) png_set_tRNS_to_alpha(rd.png);
            if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);

            png_set_interlace_handling(rd.png);
            png_read_update_info(rd.png, rd.info);

            image.width = static_cast<int>(width);
            image.height = static_cast<int>(height);
            image.channels = has_alpha ? 4 : 3;

            const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
            if (rowbytes != image.stride()) {
                throw std::runtime_error("rowbytes mismatch after transforms");
            }

            image.pixels.resize(rowbytes * height);
            std::vector<png_bytep> row_pointers(height);
            for (png_uint_32 y = 0; y < height; ++y) {
                row_pointers[y] = image.pixels.data() + y * rowbytes;
            }

            png_read_image(rd.png, row_pointers.data());
            png_read_end(rd.png, nullptr);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("PNG decode failed: ") + e.what(), "png_codec");
            throw CodecFailure(std::string("decode_png: ") + e.what());
        }

        Logger::log(LogLevel::Debug,
                    "Decoded PNG " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                    (image.has_alpha() ? " (alpha)" : ""),
                    "png_codec");
        return image;
    }

} // namespace kbfit
