#include "../libkbfit/include/format_strategy.hpp"
#include "../libkbfit/include/output_format.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace kbfit;

TEST_CASE("Lossy formats are searchable, PNG is not", "[strategy]") {
    STATIC_REQUIRE(select_strategy(OutputFormat::Jpeg) == SearchApplicability::Searchable);
    STATIC_REQUIRE(select_strategy(OutputFormat::Webp) == SearchApplicability::Searchable);
    STATIC_REQUIRE(select_strategy(OutputFormat::Png) == SearchApplicability::NotSearchable);
    CHECK(to_string(SearchApplicability::NotSearchable) == "not-searchable");
}

TEST_CASE("Output format names and aliases", "[output_format]") {
    SECTION("parsing is case-insensitive and accepts a leading dot") {
        CHECK(parse_output_format("jpg") == OutputFormat::Jpeg);
        CHECK(parse_output_format("JPEG") == OutputFormat::Jpeg);
        CHECK(parse_output_format(".jpe") == OutputFormat::Jpeg);
        CHECK(parse_output_format("WebP") == OutputFormat::Webp);
        CHECK(parse_output_format(".png") == OutputFormat::Png);
    }

    SECTION("unknown names are rejected") {
        CHECK_FALSE(parse_output_format("gif").has_value());
        CHECK_FALSE(parse_output_format("").has_value());
        CHECK_FALSE(parse_output_format(".").has_value());
    }

    SECTION("extensions and MIME types") {
        CHECK(to_string(OutputFormat::Jpeg) == "jpg");
        CHECK(extension_for(OutputFormat::Jpeg) == ".jpg");
        CHECK(extension_for(OutputFormat::Webp) == ".webp");
        CHECK(extension_for(OutputFormat::Png) == ".png");
        CHECK(mime_for(OutputFormat::Jpeg) == "image/jpeg");
        CHECK(mime_for(OutputFormat::Webp) == "image/webp");
        CHECK(mime_for(OutputFormat::Png) == "image/png");
    }
}
