#include "../libkbfit/include/codec_registry.hpp"
#include "../libkbfit/include/errors.hpp"
#include "../libkbfit/include/image_loader.hpp"
#include "../libkbfit/include/jpeg_codec.hpp"
#include "../libkbfit/include/png_codec.hpp"
#include "../libkbfit/include/webp_codec.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kbfit;

namespace {

bool starts_with(const std::vector<uint8_t>& data, const std::vector<uint8_t>& prefix) {
    return data.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), data.begin());
}

} // namespace

TEST_CASE("JPEG codec", "[codec][jpeg]") {
    const JpegCodec codec;
    const Image image = test::make_noise_image(64, 48);

    SECTION("produces a JPEG stream") {
        const auto bytes = codec.encode(image, 80);
        REQUIRE(bytes.size() > 4);
        CHECK(starts_with(bytes, {0xFF, 0xD8, 0xFF}));
        CHECK(bytes[bytes.size() - 2] == 0xFF);
        CHECK(bytes[bytes.size() - 1] == 0xD9);
    }

    SECTION("size never shrinks as quality rises over 1..100") {
        std::size_t previous = 0;
        for (int q = 1; q <= 100; ++q) {
            const std::size_t size = codec.encode(image, q).size();
            INFO("q=" << q << " size=" << size << " previous=" << previous);
            CHECK(size >= previous);
            previous = size;
        }
        CHECK(codec.encode(image, 100).size() > codec.encode(image, 1).size());
    }

    SECTION("same input gives the same bytes") {
        CHECK(codec.encode(image, 55) == codec.encode(image, 55));
    }

    SECTION("decodes back to the original dimensions") {
        const Image decoded = decode_jpeg(codec.encode(image, 90));
        CHECK(decoded.width == 64);
        CHECK(decoded.height == 48);
        CHECK(decoded.channels == 3);
        CHECK(decoded.pixels.size() == decoded.stride() * 48);
    }

    SECTION("rejects RGBA input") {
        const Image rgba = test::make_noise_image(8, 8, 4);
        CHECK_THROWS_AS(codec.encode(rgba, 80), CodecFailure);
    }

    SECTION("rejects an empty image") {
        CHECK_THROWS_AS(codec.encode(Image{}, 80), CodecFailure);
    }

    SECTION("corrupt data fails to decode") {
        const std::vector<uint8_t> garbage = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
        CHECK_THROWS_AS(decode_jpeg(garbage), CodecFailure);
    }
}

TEST_CASE("WebP codec", "[codec][webp]") {
    const WebpCodec codec;

    SECTION("produces a RIFF/WEBP container") {
        const auto bytes = codec.encode(test::make_noise_image(32, 32), 75);
        REQUIRE(bytes.size() > 12);
        CHECK(std::memcmp(bytes.data(), "RIFF", 4) == 0);
        CHECK(std::memcmp(bytes.data() + 8, "WEBP", 4) == 0);
    }

    SECTION("keeps alpha") {
        const auto bytes = codec.encode(test::make_noise_image(16, 16, 4), 75);
        const Image decoded = decode_webp(bytes);
        CHECK(decoded.channels == 4);
        CHECK(decoded.width == 16);
        CHECK(decoded.height == 16);
    }

    SECTION("size tracks quality over 1..100") {
        // VP8 may dip slightly between neighbouring qualities; no size may
        // fall more than 2% below the largest one seen so far
        const Image image = test::make_noise_image(64, 64);
        std::size_t previous = 0;
        std::size_t peak = 0;
        for (int q = 1; q <= 100; ++q) {
            const std::size_t size = codec.encode(image, q).size();
            INFO("q=" << q << " size=" << size << " previous=" << previous << " peak=" << peak);
            CHECK(size * 50 >= peak * 49);
            peak = std::max(peak, size);
            previous = size;
        }
        CHECK(codec.encode(image, 5).size() < codec.encode(image, 95).size());
    }
}

TEST_CASE("PNG codec", "[codec][png]") {
    const PngCodec codec;

    SECTION("has no quality knob") {
        CHECK_FALSE(codec.has_quality_knob());
        const Image image = test::make_noise_image(16, 16);
        CHECK(codec.encode(image, 1) == codec.encode(image, 100));
    }

    SECTION("round-trips RGB pixels exactly") {
        const Image image = test::make_noise_image(33, 17);
        const auto bytes = codec.encode(image, 0);
        CHECK(starts_with(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}));

        const Image decoded = decode_png(bytes);
        CHECK(decoded.width == image.width);
        CHECK(decoded.height == image.height);
        CHECK(decoded.channels == 3);
        CHECK(decoded.pixels == image.pixels);
    }

    SECTION("round-trips translucent RGBA pixels exactly") {
        const Image image = test::make_noise_image(20, 10, 4);
        const Image decoded = decode_png(codec.encode(image, 0));
        CHECK(decoded.channels == 4);
        CHECK(decoded.pixels == image.pixels);
    }

    SECTION("few colours compress well") {
        const Image flat = test::make_solid_image(64, 64, {10, 20, 30});
        const Image decoded = decode_png(codec.encode(flat, 0));
        CHECK(decoded.pixels == flat.pixels);
        CHECK(codec.encode(flat, 0).size() < 200);
    }

    SECTION("rejects data without a PNG signature") {
        const std::vector<uint8_t> garbage(32, 0x42);
        CHECK_THROWS_AS(decode_png(garbage), CodecFailure);
    }
}

TEST_CASE("Codec registry", "[codec][registry]") {
    CodecRegistry registry;

    SECTION("has a built-in codec per format") {
        REQUIRE(registry.find_by_format(OutputFormat::Jpeg) != nullptr);
        REQUIRE(registry.find_by_format(OutputFormat::Webp) != nullptr);
        REQUIRE(registry.find_by_format(OutputFormat::Png) != nullptr);
        CHECK(registry.find_by_format(OutputFormat::Jpeg)->get_name() == "JpegCodec");
        CHECK(registry.all().size() == 3);
    }

    SECTION("later registrations shadow built-ins") {
        registry.register_codec(std::make_unique<test::SyntheticCodec>(test::SyntheticCodec::linear(1, 1)));
        CHECK(registry.find_by_format(OutputFormat::Jpeg)->get_name() == "SyntheticCodec");
        CHECK(registry.find_by_format(OutputFormat::Png)->get_name() == "PngCodec");
    }
}

TEST_CASE("Image loader dispatches on content", "[codec][loader]") {
    const Image image = test::make_noise_image(24, 24);

    SECTION("JPEG bytes") {
        const Image loaded = load_image_from_memory(JpegCodec().encode(image, 85), "whatever.bin");
        CHECK(loaded.width == 24);
        CHECK(loaded.channels == 3);
    }

    SECTION("PNG bytes") {
        const Image loaded = load_image_from_memory(PngCodec().encode(image, 0));
        CHECK(loaded.pixels == image.pixels);
    }

    SECTION("missing file") {
        CHECK_THROWS_AS(load_image("/nonexistent/kbfit/none.png"), std::runtime_error);
    }

    SECTION("empty and unsupported data") {
        CHECK_THROWS_AS(load_image_from_memory(std::vector<uint8_t>{}), CodecFailure);
        const std::string text = "just some plain text, not an image at all\n";
        const std::vector<uint8_t> bytes(text.begin(), text.end());
        CHECK_THROWS_AS(load_image_from_memory(bytes, "notes.txt"), CodecFailure);
    }
}
