#include "../libkbfit/include/file_utils.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>
#include <vector>

using namespace kbfit;
namespace fs = std::filesystem;

TEST_CASE("Output path construction", "[file_utils]") {
    CHECK(build_output_path("photos/cat.png", "out", OutputFormat::Jpeg) == fs::path("out") / "cat_out.jpg");
    CHECK(build_output_path("/tmp/a.b.jpeg", "/x", OutputFormat::Webp) == fs::path("/x") / "a.b_out.webp");
    CHECK(build_output_path("noext", ".", OutputFormat::Png) == fs::path(".") / "noext_out.png");
}

TEST_CASE("Same-directory guard", "[file_utils]") {
    test::TempDir tmp("samedir");
    const fs::path sub = tmp.path() / "sub";
    fs::create_directories(sub);

    CHECK(same_directory(tmp.path(), tmp.path()));
    CHECK(same_directory(sub, sub / ".." / "sub"));
    CHECK(same_directory(sub, sub / ""));
    CHECK_FALSE(same_directory(tmp.path(), sub));

    SECTION("paths that do not exist yet are compared after normalization") {
        CHECK(same_directory(tmp.path() / "missing", tmp.path() / "x" / ".." / "missing"));
        CHECK_FALSE(same_directory(tmp.path() / "missing", tmp.path()));
    }
}

TEST_CASE("Whole-file read and write", "[file_utils]") {
    test::TempDir tmp("io");
    const std::vector<uint8_t> data = {0, 1, 2, 3, 250, 251, 252};

    SECTION("write creates parent directories and read returns the same bytes") {
        const fs::path target = tmp.path() / "nested" / "dir" / "blob.bin";
        write_file(target, data);
        CHECK(fs::exists(target));
        CHECK_FALSE(fs::exists(fs::path(target.string() + ".part")));
        CHECK(read_file(target) == data);
    }

    SECTION("write replaces an existing file") {
        const fs::path target = tmp.path() / "blob.bin";
        write_file(target, std::vector<uint8_t>(100, 7));
        write_file(target, data);
        CHECK(fs::file_size(target) == data.size());
    }

    SECTION("reading a missing file throws") {
        CHECK_THROWS_AS(read_file(tmp.path() / "nope.jpg"), std::runtime_error);
    }

    SECTION("reading a directory throws") {
        CHECK_THROWS_AS(read_file(tmp.path()), std::runtime_error);
    }
}
