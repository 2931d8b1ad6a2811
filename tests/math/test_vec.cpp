// planar_math 2D vector tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <planar/math/math.hpp>

#include "../support/scalars.hpp"

using namespace planar_math;
using planar_test::as_double;
using planar_test::num;
using planar_test::vec;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Products
// =============================================================================

TEMPLATE_TEST_CASE("Vector products", "[math][vec]", float, Fix64) {
    const auto a = vec<TestType>(1, 2);
    const auto b = vec<TestType>(3, 4);

    SECTION("dot") {
        REQUIRE(dot(a, b) == num<TestType>(11));
    }

    SECTION("cross") {
        REQUIRE(cross(a, b) == num<TestType>(-2));
        REQUIRE(cross(b, a) == num<TestType>(2));
    }

    SECTION("triple product is perpendicular to a, toward b") {
        const auto ab = vec<TestType>(1, 0);
        const auto target = vec<TestType>(0.5, 3);
        const auto d = triple_product(ab, target, ab);
        REQUIRE(dot(d, ab) == ScalarTraits<TestType>::zero());
        REQUIRE(dot(d, target) > ScalarTraits<TestType>::zero());
    }

    SECTION("collinear triple product vanishes") {
        const auto d = triple_product(a, vec<TestType>(2, 4), a);
        REQUIRE(is_zero(d));
    }
}

// =============================================================================
// Length and Normalization
// =============================================================================

TEMPLATE_TEST_CASE("Vector length", "[math][vec]", float, Fix64) {
    const auto v = vec<TestType>(3, 4);
    REQUIRE(length_squared(v) == num<TestType>(25));
    REQUIRE_THAT(as_double(length(v)), WithinAbs(5.0, 1e-6));
}

TEMPLATE_TEST_CASE("Vector normalize", "[math][vec]", float, Fix64) {
    SECTION("unit length") {
        const auto n = normalize(vec<TestType>(3, 4));
        REQUIRE_THAT(as_double(n.x), WithinAbs(0.6, 1e-6));
        REQUIRE_THAT(as_double(n.y), WithinAbs(0.8, 1e-6));
    }

    SECTION("zero stays zero") {
        const auto n = normalize(vec2_consts<TestType>::zero());
        REQUIRE(is_zero(n));
    }

    SECTION("large components") {
        const auto n = normalize(vec<TestType>(30000, -40000));
        REQUIRE_THAT(as_double(n.x), WithinAbs(0.6, 1e-6));
        REQUIRE_THAT(as_double(n.y), WithinAbs(-0.8, 1e-6));
    }
}

TEST_CASE("Fix64 normalize keeps unit length for the smallest steps", "[math][vec]") {
    // Squaring either component underflows to zero
    const TVec2<Fix64> tiny(Fix64::from_raw(3), Fix64::from_raw(-4));
    const auto n = normalize(tiny);

    REQUIRE_THAT(n.x.to_double(), WithinAbs(0.6, 1e-6));
    REQUIRE_THAT(n.y.to_double(), WithinAbs(-0.8, 1e-6));
    REQUIRE_THAT(length(n).to_double(), WithinAbs(1.0, 1e-6));
}

// =============================================================================
// Utilities
// =============================================================================

TEMPLATE_TEST_CASE("Vector utilities", "[math][vec]", float, Fix64) {
    SECTION("perpendicular rotates clockwise in y-up") {
        REQUIRE(perpendicular(vec<TestType>(1, 2)) == vec<TestType>(2, -1));
    }

    SECTION("component-wise min, max, clamp") {
        const auto a = vec<TestType>(1, 5);
        const auto b = vec<TestType>(3, 2);
        REQUIRE(planar_math::min(a, b) == vec<TestType>(1, 2));
        REQUIRE(planar_math::max(a, b) == vec<TestType>(3, 5));
        REQUIRE(clamp(vec<TestType>(-1, 9), a, vec<TestType>(4, 6)) == vec<TestType>(1, 6));
    }

    SECTION("midpoint and product") {
        REQUIRE(midpoint(vec<TestType>(0, 0), vec<TestType>(4, -2)) == vec<TestType>(2, -1));
        REQUIRE(mul(vec<TestType>(2, 3), vec<TestType>(4, -1)) == vec<TestType>(8, -3));
    }

    SECTION("to_float") {
        const Vec2 f = planar_math::to_float(vec<TestType>(1.5, -2));
        REQUIRE(f == Vec2(1.5f, -2.0f));
    }
}
