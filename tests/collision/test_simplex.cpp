// planar_collision Simplex2D tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <planar/collision/collision.hpp>

#include "../support/scalars.hpp"

#include <stdexcept>

using namespace planar_collision;
using planar_test::vec;

// =============================================================================
// Construction Tests
// =============================================================================

TEMPLATE_TEST_CASE("Simplex2D construction", "[collision][simplex]", float, Fix64) {
    const auto a = vec<TestType>(1, 0);
    const auto b = vec<TestType>(0, 1);
    const auto c = vec<TestType>(-1, -1);

    SECTION("empty") {
        const Simplex2D<TestType> s;
        REQUIRE(s.empty());
        REQUIRE(s.count() == 0);
        REQUIRE(s.begin() == s.end());
        REQUIRE_THROWS_AS(s.a(), std::out_of_range);
    }

    SECTION("0-simplex") {
        const Simplex2D<TestType> s(a);
        REQUIRE(s.zero_simplex());
        REQUIRE(s.count() == 1);
        REQUIRE(s.a() == a);
        REQUIRE_THROWS_AS(s.b(), std::out_of_range);
    }

    SECTION("1-simplex") {
        const Simplex2D<TestType> s(a, b);
        REQUIRE(s.one_simplex());
        REQUIRE(s[1] == b);
        REQUIRE_THROWS_AS(s.c(), std::out_of_range);
    }

    SECTION("2-simplex") {
        const Simplex2D<TestType> s(a, b, c);
        REQUIRE(s.two_simplex());
        REQUIRE_FALSE(s.one_simplex());
        REQUIRE(s.c() == c);

        int visited = 0;
        for (const auto& p : s) {
            REQUIRE(p == s[visited]);
            ++visited;
        }
        REQUIRE(visited == 3);
    }
}

// =============================================================================
// Insertion Tests
// =============================================================================

TEMPLATE_TEST_CASE("Simplex2D insert", "[collision][simplex]", float, Fix64) {
    const auto a = vec<TestType>(1, 0);
    const auto b = vec<TestType>(0, 1);
    const auto c = vec<TestType>(-1, -1);
    const auto p = vec<TestType>(5, 5);

    SECTION("index 0 on a full simplex drops c") {
        Simplex2D<TestType> s(a, b, c);
        s.insert(p, 0);
        REQUIRE(s.count() == 3);
        REQUIRE(s.a() == p);
        REQUIRE(s.b() == a);
        REQUIRE(s.c() == b);
    }

    SECTION("index 1 on a full simplex") {
        Simplex2D<TestType> s(a, b, c);
        s.insert(p, 1);
        REQUIRE(s.a() == a);
        REQUIRE(s.b() == p);
        REQUIRE(s.c() == b);
    }

    SECTION("index 2 on a full simplex replaces c") {
        Simplex2D<TestType> s(a, b, c);
        s.insert(p, 2);
        REQUIRE(s.a() == a);
        REQUIRE(s.b() == b);
        REQUIRE(s.c() == p);
    }

    SECTION("growing from a segment") {
        Simplex2D<TestType> s(a, b);
        s.insert(p, 0);
        REQUIRE(s.two_simplex());
        REQUIRE(s.a() == p);
        REQUIRE(s.b() == a);
        REQUIRE(s.c() == b);
    }

    SECTION("append to a point") {
        Simplex2D<TestType> s(a);
        s.insert(p, 1);
        REQUIRE(s.one_simplex());
        REQUIRE(s.b() == p);
    }

    SECTION("out of range index throws") {
        Simplex2D<TestType> s(a);
        REQUIRE_THROWS_AS(s.insert(p, 2), std::out_of_range);
        REQUIRE_THROWS_AS(s.insert(p, -1), std::out_of_range);
        REQUIRE(s.count() == 1);
    }
}

// =============================================================================
// Equality Tests
// =============================================================================

TEMPLATE_TEST_CASE("Simplex2D equality ignores order", "[collision][simplex]", float, Fix64) {
    const auto a = vec<TestType>(1, 0);
    const auto b = vec<TestType>(0, 1);
    const auto c = vec<TestType>(-1, -1);

    REQUIRE(Simplex2D<TestType>(a, b, c) == Simplex2D<TestType>(c, a, b));
    REQUIRE(Simplex2D<TestType>(a, b) == Simplex2D<TestType>(b, a));
    REQUIRE(Simplex2D<TestType>(a, b) != Simplex2D<TestType>(a, b, c));
    REQUIRE(Simplex2D<TestType>(a, b, c) != Simplex2D<TestType>(a, b, vec<TestType>(2, 2)));
    REQUIRE(Simplex2D<TestType>() == Simplex2D<TestType>());
}
