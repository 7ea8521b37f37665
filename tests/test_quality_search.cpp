#include "../libkbfit/include/errors.hpp"
#include "../libkbfit/include/feasibility_oracle.hpp"
#include "../libkbfit/include/quality_search.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

using namespace kbfit;
using kbfit::test::SyntheticCodec;

namespace {

SearchOutcome run(const SyntheticCodec& codec, const QualityBounds& bounds,
                  const std::uintmax_t target, const SearchOptions& options = {}) {
    const Image image = test::make_solid_image(4, 4, {});
    FeasibilityOracle oracle(codec, image, target, nullptr);
    return search_max_quality(oracle, bounds, options);
}

// 80 KB at q=1 rising linearly to 500 KB at q=95
std::size_t interpolated_size(const int q) {
    constexpr std::size_t low = 80 * 1024;
    constexpr std::size_t high = 500 * 1024;
    return low + static_cast<std::size_t>(q - 1) * (high - low) / 94;
}

} // namespace

TEST_CASE("Search returns the maximal feasible quality", "[search]") {
    const auto codec = SyntheticCodec::linear(1000, 100);

    const std::vector<QualityBounds> bounds_set = {
        {1, 100}, {25, 95}, {1, 1}, {50, 50}, {10, 11}, {37, 64}
    };
    const std::vector<std::uintmax_t> targets = {
        1000, 1100, 1101, 3500, 5550, 9999, 10500, 11000, 20000
    };

    for (const auto& b : bounds_set) {
        for (const auto target : targets) {
            const SearchOutcome outcome = run(codec, b, target);

            if (codec.size_at(b.min_quality) > target) {
                CHECK(outcome.reason == TerminalReason::InfeasibleAtMinimum);
                CHECK_FALSE(outcome.best.has_value());
                continue;
            }

            REQUIRE(outcome.reason == TerminalReason::FeasibleFound);
            REQUIRE(outcome.best.has_value());
            const int q = outcome.best->quality;
            CHECK(q >= b.min_quality);
            CHECK(q <= b.max_quality);
            CHECK(outcome.best->size <= target);
            CHECK(outcome.best->size == outcome.best->bytes.size());
            CHECK((q == b.max_quality || codec.size_at(q + 1) > target));
        }
    }
}

TEST_CASE("Every probe stays inside the bounds", "[search]") {
    const auto codec = SyntheticCodec::linear(0, 10);
    const SearchOutcome outcome = run(codec, {30, 70}, 555);

    REQUIRE_FALSE(codec.calls().empty());
    for (const int q : codec.calls()) {
        CHECK(q >= 30);
        CHECK(q <= 70);
    }
    REQUIRE(outcome.best.has_value());
    CHECK(outcome.best->quality == 55);
}

TEST_CASE("Search is deterministic", "[search]") {
    const auto first = SyntheticCodec::linear(500, 37);
    const auto second = SyntheticCodec::linear(500, 37);

    const SearchOutcome a = run(first, {5, 90}, 2222);
    const SearchOutcome b = run(second, {5, 90}, 2222);

    CHECK(first.calls() == second.calls());
    CHECK(a.trail == b.trail);
    CHECK(a.reason == b.reason);
    CHECK(a.final_quality() == b.final_quality());
}

TEST_CASE("Infeasible at minimum quality", "[search][boundary]") {
    const auto codec = SyntheticCodec::linear(10000, 100);
    const SearchOutcome outcome = run(codec, {25, 95}, 5000);

    CHECK(outcome.reason == TerminalReason::InfeasibleAtMinimum);
    CHECK_FALSE(outcome.best.has_value());

    SECTION("the minimum-quality probe is kept as fallback") {
        REQUIRE(outcome.fallback.has_value());
        CHECK(outcome.fallback->quality == 25);
        CHECK(outcome.fallback->size == codec.size_at(25));
        CHECK(outcome.final_quality() == 25);
    }

    SECTION("every probe in the trail is infeasible") {
        for (const auto& rec : outcome.trail) {
            CHECK_FALSE(rec.feasible);
        }
    }
}

TEST_CASE("Trivially feasible target selects max quality", "[search][boundary]") {
    const auto codec = SyntheticCodec::linear(100, 10);
    const SearchOutcome outcome = run(codec, {25, 95}, codec.size_at(95));

    REQUIRE(outcome.best.has_value());
    CHECK(outcome.reason == TerminalReason::FeasibleFound);
    CHECK(outcome.best->quality == 95);
    CHECK_FALSE(outcome.fallback.has_value());
    CHECK(outcome.iterations() <= 7);
}

TEST_CASE("500KB to 80KB image fits 150KB within seven probes", "[search][scenario]") {
    const SyntheticCodec codec(interpolated_size);
    constexpr std::uintmax_t target = 150 * 1024;

    const SearchOutcome outcome = run(codec, {1, 95}, target);

    REQUIRE(outcome.best.has_value());
    CHECK(outcome.best->quality == 16);
    CHECK(outcome.best->size <= target);
    CHECK(interpolated_size(17) > target);
    CHECK(outcome.iterations() <= static_cast<std::size_t>(std::ceil(std::log2(95.0))));
    CHECK(codec.calls().size() == outcome.iterations());
}

TEST_CASE("Probe count is logarithmic in the interval", "[search]") {
    for (std::uintmax_t target = 1; target <= 120; target += 7) {
        const auto codec = SyntheticCodec::linear(0, 1);
        const SearchOutcome outcome = run(codec, {1, 100}, target);
        CHECK(outcome.iterations() <= 7);
    }
}

TEST_CASE("Invalid bounds are rejected before any probe", "[search][errors]") {
    const auto codec = SyntheticCodec::linear(0, 1);
    const Image image = test::make_solid_image(2, 2, {});
    FeasibilityOracle oracle(codec, image, 1000);

    SECTION("min greater than max") {
        CHECK_THROWS_AS(search_max_quality(oracle, {50, 10}), InvalidBounds);
    }
    SECTION("bounds outside [1, 100]") {
        CHECK_THROWS_AS(search_max_quality(oracle, {0, 50}), InvalidBounds);
        CHECK_THROWS_AS(search_max_quality(oracle, {10, 101}), InvalidBounds);
    }
    SECTION("zero target") {
        FeasibilityOracle zero(codec, image, 0);
        CHECK_THROWS_AS(search_max_quality(zero, {10, 50}), InvalidBounds);
    }

    CHECK(codec.calls().empty());
    CHECK(oracle.probe_count() == 0);
}

TEST_CASE("Bounds short-circuit", "[search][probe-bounds]") {
    const SearchOptions options{true};

    SECTION("stops after one probe when max quality fits") {
        const auto codec = SyntheticCodec::linear(0, 10);
        const SearchOutcome outcome = run(codec, {25, 95}, 10000, options);
        CHECK(codec.calls() == std::vector<int>{95});
        REQUIRE(outcome.best.has_value());
        CHECK(outcome.best->quality == 95);
    }

    SECTION("stops after two probes when min quality does not fit") {
        const auto codec = SyntheticCodec::linear(0, 10);
        const SearchOutcome outcome = run(codec, {25, 95}, 100, options);
        CHECK(codec.calls() == std::vector<int>{95, 25});
        CHECK(outcome.reason == TerminalReason::InfeasibleAtMinimum);
        REQUIRE(outcome.fallback.has_value());
        CHECK(outcome.fallback->quality == 25);
    }

    SECTION("bisects the interior and agrees with the plain search") {
        const auto plain_codec = SyntheticCodec::linear(0, 10);
        const auto short_codec = SyntheticCodec::linear(0, 10);
        const SearchOutcome plain = run(plain_codec, {25, 95}, 613);
        const SearchOutcome shortcut = run(short_codec, {25, 95}, 613, options);
        CHECK(plain.final_quality() == shortcut.final_quality());
        CHECK(shortcut.final_quality() == 61);
        CHECK(short_codec.calls().front() == 95);
        CHECK(short_codec.calls()[1] == 25);
    }

    SECTION("minimum is the answer when nothing above it fits") {
        const auto codec = SyntheticCodec::linear(0, 10);
        const SearchOutcome outcome = run(codec, {25, 95}, 255, options);
        REQUIRE(outcome.best.has_value());
        CHECK(outcome.best->quality == 25);
    }
}

TEST_CASE("Codec failure aborts the search with EncodingError", "[search][errors]") {
    auto codec = SyntheticCodec::linear(0, 10);
    codec.fail_at(60);
    const Image image = test::make_solid_image(2, 2, {});
    FeasibilityOracle oracle(codec, image, 10000);

    try {
        (void)search_max_quality(oracle, {25, 95});
        FAIL("expected EncodingError");
    } catch (const EncodingError& e) {
        CHECK(e.quality() == 60);
    }
}

TEST_CASE("Terminal reasons have stable names", "[search]") {
    CHECK(to_string(TerminalReason::FeasibleFound) == "feasible-found");
    CHECK(to_string(TerminalReason::InfeasibleAtMinimum) == "infeasible-at-minimum");
    CHECK(to_string(TerminalReason::NotSearchable) == "format-not-searchable");
}
