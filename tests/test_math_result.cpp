#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/math.hpp"
#include "core/result.hpp"
#include "core/random.hpp"
#include <string>

using Catch::Matchers::WithinAbs;
using namespace sk::core;

TEST_CASE("lerp clamps its parameter", "[core]") {
    REQUIRE_THAT(lerp(0.0f, 10.0f, 0.25f), WithinAbs(2.5, 1e-6));
    REQUIRE_THAT(lerp(0.0f, 10.0f, 2.0f), WithinAbs(10.0, 1e-6));
    REQUIRE_THAT(lerp(0.0f, 10.0f, -1.0f), WithinAbs(0.0, 1e-6));
}

TEST_CASE("inverse_lerp of an empty range is zero", "[core]") {
    REQUIRE(inverse_lerp(1.0f, 1.0f, 5.0f) == 0.0f);
    REQUIRE_THAT(inverse_lerp(0.0f, 4.0f, 1.0f), WithinAbs(0.25, 1e-6));
    REQUIRE(approximately(1.0f, 1.0f + 1e-7f));
    REQUIRE_FALSE(approximately(1.0f, 1.1f));
}

TEST_CASE("Result carries value or error", "[core]") {
    Result<int> ok = Ok(42);
    REQUIRE(ok);
    REQUIRE(ok.value() == 42);
    REQUIRE(ok.try_value().has_value());

    auto bad = Error<int>("boom");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.is_error());
    REQUIRE(bad.error() == "boom");
    REQUIRE_FALSE(bad.try_value().has_value());
}

TEST_CASE("Random with equal seeds repeats its sequence", "[core]") {
    Random a(7), b(7);
    for(int i = 0; i < 16; ++i) REQUIRE(a.unit() == b.unit());
    REQUIRE(a.range(3.0f, 3.0f) == 3.0f);
    REQUIRE(a.range(5.0f, 1.0f) == 5.0f);
    for(int i = 0; i < 100; ++i) {
        const float r = a.range(0.5f, 1.5f);
        REQUIRE(r >= 0.5f);
        REQUIRE(r <= 1.5f);
        REQUIRE(a.index(3) < 3);
    }
}
