#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "timeline/curve.hpp"

using Catch::Matchers::WithinAbs;
using sk::timeline::Curve;
using sk::timeline::Keyframe;

TEST_CASE("linear curve is exact between its keys", "[curve]") {
    const Curve c = Curve::linear(0.0f, 0.0f, 1.0f, 1.0f);
    REQUIRE_THAT(c.evaluate(0.25f), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(c.evaluate(0.5f), WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(c.evaluate(0.9f), WithinAbs(0.9, 1e-6));

    const Curve down = Curve::linear(0.0f, 2.0f, 2.0f, 0.0f);
    REQUIRE_THAT(down.evaluate(0.5f), WithinAbs(1.5, 1e-6));
}

TEST_CASE("curve clamps outside its key range", "[curve]") {
    const Curve c = Curve::linear(0.2f, 1.0f, 0.8f, 3.0f);
    REQUIRE(c.evaluate(0.0f) == 1.0f);
    REQUIRE(c.evaluate(-5.0f) == 1.0f);
    REQUIRE(c.evaluate(1.0f) == 3.0f);
}

TEST_CASE("empty curve is the identity", "[curve]") {
    const Curve c;
    REQUIRE(c.empty());
    REQUIRE(c.evaluate(0.3f) == 0.3f);
}

TEST_CASE("ease in out is symmetric with flat ends", "[curve]") {
    const Curve c = Curve::ease_in_out(0.0f, 0.0f, 1.0f, 1.0f);
    REQUIRE_THAT(c.evaluate(0.5f), WithinAbs(0.5, 1e-6));
    REQUIRE(c.evaluate(0.1f) < 0.1f);
    REQUIRE(c.evaluate(0.9f) > 0.9f);
}

TEST_CASE("keys are kept sorted", "[curve]") {
    Curve c({Keyframe{1.0f, 10.0f, 0.0f, 0.0f}, Keyframe{0.0f, 0.0f, 0.0f, 0.0f}});
    REQUIRE(c.keys().front().time == 0.0f);
    c.add_key(Keyframe{0.5f, 4.0f, 0.0f, 0.0f});
    REQUIRE(c.keys().size() == 3);
    REQUIRE(c.keys()[1].time == 0.5f);
    REQUIRE(c.evaluate(0.5f) == 4.0f);

    const Curve flat = Curve::constant(0.0f, 1.0f, 0.7f);
    REQUIRE_THAT(flat.evaluate(0.33f), WithinAbs(0.7, 1e-6));
}
