// planar_collision AABB2D tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <planar/collision/collision.hpp>

#include "../support/scalars.hpp"

#include <stdexcept>
#include <vector>

using namespace planar_collision;
using planar_test::as_double;
using planar_test::num;
using planar_test::vec;
using Catch::Matchers::WithinAbs;

namespace {

template<typename T>
AABB2D<T> box(double min_x, double min_y, double max_x, double max_y) {
    return AABB2D<T>(num<T>(min_x), num<T>(min_y), num<T>(max_x), num<T>(max_y));
}

} // namespace

// =============================================================================
// Accessor Tests
// =============================================================================

TEMPLATE_TEST_CASE("AABB2D accessors", "[collision][aabb]", float, Fix64) {
    const auto b = box<TestType>(1, 2, 5, 10);

    REQUIRE(b.left() == num<TestType>(1));
    REQUIRE(b.top() == num<TestType>(2));
    REQUIRE(b.right() == num<TestType>(5));
    REQUIRE(b.bottom() == num<TestType>(10));
    REQUIRE(b.width() == num<TestType>(4));
    REQUIRE(b.height() == num<TestType>(8));
    REQUIRE(b.center() == vec<TestType>(3, 6));
    REQUIRE(b.extents() == vec<TestType>(2, 4));
}

TEMPLATE_TEST_CASE("AABB2D default is a degenerate box at the origin", "[collision][aabb]", float, Fix64) {
    const AABB2D<TestType> b;
    REQUIRE(b.min == planar_math::vec2_consts<TestType>::zero());
    REQUIRE(b.max == planar_math::vec2_consts<TestType>::zero());
}

// =============================================================================
// Construction Tests
// =============================================================================

TEMPLATE_TEST_CASE("AABB2D from_vertices", "[collision][aabb]", float, Fix64) {
    SECTION("tight bounds") {
        const std::vector<TVec2<TestType>> points = {
            vec<TestType>(3, -1), vec<TestType>(-2, 4), vec<TestType>(1, 1), vec<TestType>(0, -5)};
        const auto b = AABB2D<TestType>::from_vertices(points);
        REQUIRE(b == box<TestType>(-2, -5, 3, 4));
    }

    SECTION("single vertex") {
        const std::vector<TVec2<TestType>> points = {vec<TestType>(7, 8)};
        const auto b = AABB2D<TestType>::from_vertices(points);
        REQUIRE(b.min == b.max);
    }

    SECTION("empty input throws") {
        const std::vector<TVec2<TestType>> points;
        REQUIRE_THROWS_AS(AABB2D<TestType>::from_vertices(points), std::invalid_argument);
    }
}

TEMPLATE_TEST_CASE("AABB2D transformed", "[collision][aabb]", float, Fix64) {
    const auto b = box<TestType>(-1, -2, 1, 2);

    SECTION("translation and scale") {
        const Transform2D<TestType> t(vec<TestType>(10, 20), ScalarTraits<TestType>::zero(), vec<TestType>(2, 3));
        REQUIRE(AABB2D<TestType>::transformed(b, t) == box<TestType>(8, 14, 12, 26));
    }

    SECTION("quarter turn swaps the extents") {
        const Transform2D<TestType> t(planar_math::vec2_consts<TestType>::zero(), ScalarTraits<TestType>::half_pi());
        const auto r = AABB2D<TestType>::transformed(b, t);
        REQUIRE_THAT(as_double(r.width()), WithinAbs(4.0, 1e-5));
        REQUIRE_THAT(as_double(r.height()), WithinAbs(2.0, 1e-5));
    }

    SECTION("rotation grows the box") {
        const Transform2D<TestType> t(planar_math::vec2_consts<TestType>::zero(), num<TestType>(0.5));
        const auto r = AABB2D<TestType>::transformed(b, t);
        REQUIRE(r.width() > b.width());
        REQUIRE_THAT(as_double(r.center().x), WithinAbs(0.0, 1e-6));
    }
}

// =============================================================================
// Overlap Tests
// =============================================================================

TEMPLATE_TEST_CASE("AABB2D overlap", "[collision][aabb]", float, Fix64) {
    const auto a = box<TestType>(0, 0, 10, 10);

    SECTION("overlapping") {
        REQUIRE(AABB2D<TestType>::test_overlap(a, box<TestType>(5, 5, 15, 15)));
    }

    SECTION("separated on one axis") {
        REQUIRE_FALSE(AABB2D<TestType>::test_overlap(a, box<TestType>(20, 0, 30, 10)));
        REQUIRE_FALSE(AABB2D<TestType>::test_overlap(a, box<TestType>(0, -20, 10, -1)));
    }

    SECTION("touching edges overlap") {
        REQUIRE(AABB2D<TestType>::test_overlap(a, box<TestType>(10, 0, 20, 10)));
        REQUIRE(AABB2D<TestType>::test_overlap(a, box<TestType>(10, 10, 20, 20)));
    }

    SECTION("containment overlaps") {
        REQUIRE(a.overlaps(box<TestType>(2, 2, 3, 3)));
    }

    SECTION("symmetric") {
        const AABB2D<TestType> others[] = {
            box<TestType>(5, 5, 15, 15), box<TestType>(20, 20, 30, 30), box<TestType>(10, 0, 20, 10),
            box<TestType>(-5, 3, 1, 4), box<TestType>(3, -8, 4, -0.5)};
        for (const auto& b : others) {
            REQUIRE(AABB2D<TestType>::test_overlap(a, b) == AABB2D<TestType>::test_overlap(b, a));
        }
    }
}

TEMPLATE_TEST_CASE("AABB2D strict containment", "[collision][aabb]", float, Fix64) {
    const auto a = box<TestType>(0, 0, 10, 10);

    REQUIRE(a.contains_strict(vec<TestType>(5, 5)));
    REQUIRE_FALSE(a.contains_strict(vec<TestType>(0, 5)));
    REQUIRE_FALSE(a.contains_strict(vec<TestType>(10, 10)));
    REQUIRE_FALSE(a.contains_strict(vec<TestType>(11, 5)));
}

TEMPLATE_TEST_CASE("AABB2D compose", "[collision][aabb]", float, Fix64) {
    const auto a = box<TestType>(0, 0, 2, 2);
    const auto b = box<TestType>(-1, 1, 1, 5);

    REQUIRE(a.compose(b) == box<TestType>(-1, 0, 2, 5));
    REQUIRE(a.compose(b) == b.compose(a));
    REQUIRE(a.compose(a) == a);
}
