// planar_collision SpatialHash2D tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <planar/collision/collision.hpp>

#include "../support/scalars.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace planar_collision;
using planar_test::num;
using planar_test::vec;

namespace {

template<typename T>
Transform2D<T> at(double x, double y) {
    return Transform2D<T>(vec<T>(x, y));
}

template<typename T>
AABB2D<T> box(double min_x, double min_y, double max_x, double max_y) {
    return AABB2D<T>(num<T>(min_x), num<T>(min_y), num<T>(max_x), num<T>(max_y));
}

template<typename Entries>
std::vector<int> ids_of(const Entries& entries) {
    std::vector<int> ids;
    for (const auto& entry : entries) {
        ids.push_back(entry.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEMPLATE_TEST_CASE("SpatialHash2D rejects a non-positive cell size", "[collision][spatial_hash]", float, Fix64) {
    using Grid = SpatialHash2D<int, TestType>;

    REQUIRE_THROWS_AS(Grid(num<TestType>(0)), std::invalid_argument);
    REQUIRE_THROWS_AS(Grid(num<TestType>(-4)), std::invalid_argument);

    const Grid grid(num<TestType>(16));
    REQUIRE(grid.cell_size() == num<TestType>(16));
    REQUIRE(grid.empty());
}

// =============================================================================
// Insert / Retrieve
// =============================================================================

TEMPLATE_TEST_CASE("SpatialHash2D retrieve", "[collision][spatial_hash]", float, Fix64) {
    SpatialHash2D<int, TestType> grid(num<TestType>(10));
    const Shape<TestType> square = Rectangle<TestType>(0, 0, 5, 5);
    const Shape<TestType> probe = Circle<TestType>(1);

    grid.insert(1, square, at<TestType>(0, 0));
    grid.insert(2, square, at<TestType>(3, 3));
    grid.insert(3, square, at<TestType>(100, 100));

    REQUIRE(grid.size() == 3);
    REQUIRE(grid.contains(2));
    REQUIRE_FALSE(grid.contains(7));

    SECTION("nearby entities only") {
        const auto found = grid.retrieve(0, probe, at<TestType>(4, 4));
        REQUIRE(ids_of(found) == std::vector<int>{1, 2});
    }

    SECTION("the querying id is excluded") {
        const auto found = grid.retrieve(1, square, at<TestType>(0, 0));
        REQUIRE(ids_of(found) == std::vector<int>{2});
    }

    SECTION("entries carry the stored shape and transform") {
        const auto found = grid.retrieve(0, probe, at<TestType>(104, 104));
        REQUIRE(found.size() == 1);
        REQUIRE(found[0].id == 3);
        REQUIRE(found[0].shape == square);
        REQUIRE(found[0].transform.position() == vec<TestType>(100, 100));
        REQUIRE(found[0].groups == groups::All);
    }

    SECTION("sharing a cell is not enough") {
        const auto found = grid.retrieve(box<TestType>(9, 9, 9.5, 9.5));
        REQUIRE(found.empty());
    }

    SECTION("empty region") {
        REQUIRE(grid.retrieve(box<TestType>(40, 40, 60, 60)).empty());
    }

    SECTION("out-vector overloads append") {
        std::vector<typename SpatialHash2D<int, TestType>::Entry> out;
        grid.retrieve(box<TestType>(99, 99, 101, 101), groups::All, out);
        grid.retrieve(0, probe, at<TestType>(4, 4), groups::All, out);
        REQUIRE(ids_of(out) == std::vector<int>{1, 2, 3});
    }
}

TEMPLATE_TEST_CASE("SpatialHash2D reports an entity spanning many cells once", "[collision][spatial_hash]",
                   float, Fix64) {
    SpatialHash2D<int, TestType> grid(num<TestType>(10));
    grid.insert(1, Rectangle<TestType>(0, 0, 35, 35), Transform2D<TestType>::identity());

    const auto found = grid.retrieve(box<TestType>(0, 0, 40, 40));
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].id == 1);
}

TEMPLATE_TEST_CASE("SpatialHash2D handles negative coordinates", "[collision][spatial_hash]", float, Fix64) {
    SpatialHash2D<int, TestType> grid(num<TestType>(10));
    const Shape<TestType> square = Rectangle<TestType>(0, 0, 5, 5);

    grid.insert(1, square, at<TestType>(-25, -25));
    grid.insert(2, square, at<TestType>(25, 25));
    grid.insert(3, square, at<TestType>(-25, 25));

    REQUIRE(ids_of(grid.retrieve(box<TestType>(-24, -24, -22, -22))) == std::vector<int>{1});
    REQUIRE(ids_of(grid.retrieve(box<TestType>(-24, 26, -22, 28))) == std::vector<int>{3});
    REQUIRE(ids_of(grid.retrieve(box<TestType>(-30, -30, 30, 30))) == std::vector<int>{1, 2, 3});
}

TEST_CASE("SpatialHash2D clamps cells beyond the int32 range", "[collision][spatial_hash]") {
    SpatialHash2D<int, float> grid(1.0f);
    const Shape<float> point = Point<float>();

    grid.insert(1, point, at<float>(1e30, 1e30));
    grid.insert(2, point, at<float>(-1e30, -1e30));
    grid.insert(3, point, at<float>(5e9, 0));
    grid.insert(4, point, at<float>(0, 0));

    REQUIRE(ids_of(grid.retrieve(box<float>(9e29, 9e29, 2e30, 2e30))) == std::vector<int>{1});
    REQUIRE(ids_of(grid.retrieve(box<float>(-2e30, -2e30, -9e29, -9e29))) == std::vector<int>{2});
    REQUIRE(ids_of(grid.retrieve(box<float>(4e9, -1, 6e9, 1))) == std::vector<int>{3});
    REQUIRE(ids_of(grid.retrieve(box<float>(-1, -1, 1, 1))) == std::vector<int>{4});

    REQUIRE(grid.remove(1));
    REQUIRE(grid.retrieve(box<float>(9e29, 9e29, 2e30, 2e30)).empty());
}

// =============================================================================
// Replacement and Removal
// =============================================================================

TEMPLATE_TEST_CASE("SpatialHash2D re-insert replaces the entity", "[collision][spatial_hash]", float, Fix64) {
    SpatialHash2D<int, TestType> grid(num<TestType>(10));
    const Shape<TestType> square = Rectangle<TestType>(0, 0, 5, 5);

    grid.insert(1, square, at<TestType>(0, 0));
    grid.insert(1, square, at<TestType>(0, 0));
    REQUIRE(grid.size() == 1);
    REQUIRE(grid.retrieve(box<TestType>(0, 0, 5, 5)).size() == 1);

    grid.insert(1, square, at<TestType>(100, 100));
    REQUIRE(grid.size() == 1);
    REQUIRE(grid.retrieve(box<TestType>(0, 0, 5, 5)).empty());
    REQUIRE(ids_of(grid.retrieve(box<TestType>(100, 100, 105, 105))) == std::vector<int>{1});
}

TEMPLATE_TEST_CASE("SpatialHash2D remove and clear", "[collision][spatial_hash]", float, Fix64) {
    SpatialHash2D<int, TestType> grid(num<TestType>(10));
    const Shape<TestType> square = Rectangle<TestType>(0, 0, 15, 15);

    grid.insert(1, square, at<TestType>(0, 0));
    grid.insert(2, square, at<TestType>(5, 5));

    SECTION("remove") {
        REQUIRE(grid.remove(1));
        REQUIRE_FALSE(grid.remove(1));
        REQUIRE_FALSE(grid.contains(1));
        REQUIRE(ids_of(grid.retrieve(box<TestType>(0, 0, 30, 30))) == std::vector<int>{2});
    }

    SECTION("remove an unknown id") {
        REQUIRE_FALSE(grid.remove(42));
        REQUIRE(grid.size() == 2);
    }

    SECTION("clear") {
        grid.clear();
        REQUIRE(grid.empty());
        REQUIRE(grid.retrieve(box<TestType>(0, 0, 30, 30)).empty());

        grid.insert(3, square, at<TestType>(0, 0));
        REQUIRE(ids_of(grid.retrieve(box<TestType>(0, 0, 30, 30))) == std::vector<int>{3});
    }
}

// =============================================================================
// Collision Groups
// =============================================================================

TEMPLATE_TEST_CASE("SpatialHash2D filters by collision groups", "[collision][spatial_hash]", float, Fix64) {
    SpatialHash2D<int, TestType> grid(num<TestType>(10));
    const Shape<TestType> square = Rectangle<TestType>(0, 0, 5, 5);

    grid.insert(1, square, at<TestType>(0, 0), 0b0001u);
    grid.insert(2, square, at<TestType>(1, 1), 0b0010u);
    grid.insert(3, square, at<TestType>(2, 2));
    grid.insert(4, square, at<TestType>(3, 3), groups::None);

    const auto query = box<TestType>(0, 0, 10, 10);

    REQUIRE(ids_of(grid.retrieve(query, 0b0001u)) == std::vector<int>{1, 3});
    REQUIRE(ids_of(grid.retrieve(query, 0b0011u)) == std::vector<int>{1, 2, 3});
    REQUIRE(ids_of(grid.retrieve(query)) == std::vector<int>{1, 2, 3});
    REQUIRE(grid.retrieve(query, groups::None).empty());
}

// =============================================================================
// Id Types
// =============================================================================

TEST_CASE("SpatialHash2D with string ids", "[collision][spatial_hash]") {
    f32::SpatialHash2D<std::string> grid(8.0f);
    const f32::Shape circle = f32::Circle(2);

    grid.insert("player", circle, f32::Transform2D(f32::Vec2(0.0f, 0.0f)));
    grid.insert("enemy", circle, f32::Transform2D(f32::Vec2(3.0f, 0.0f)));
    grid.insert("pickup", circle, f32::Transform2D(f32::Vec2(50.0f, 50.0f)));

    const auto near_player = grid.retrieve("player", circle, f32::Transform2D(f32::Vec2(0.0f, 0.0f)));
    REQUIRE(near_player.size() == 1);
    REQUIRE(near_player[0].id == "enemy");

    // Broad-phase candidates feed the narrow phase
    const auto& hit = near_player[0];
    REQUIRE(f32::NarrowPhase::test_collision(circle, f32::Transform2D(f32::Vec2(0.0f, 0.0f)),
                                             hit.shape, hit.transform));
}
