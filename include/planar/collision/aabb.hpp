#pragma once

/// @file aabb.hpp
/// @brief Axis-aligned bounding box for planar_collision
///
/// Y points down: top() is the numerically smaller y, bottom() the larger.
/// Overlap is closed (touching boxes overlap); containment of a point is
/// strict (a point on an edge is outside).

#include "fwd.hpp"
#include "types.hpp"

#include <span>
#include <stdexcept>

namespace planar_collision {

/// Axis-aligned bounding box (min corner <= max corner, not enforced)
template<typename T>
struct AABB2D {
    using Vec = TVec2<T>;

    Vec min;
    Vec max;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Degenerate box at the origin
    AABB2D()
        : min(planar_math::vec2_consts<T>::zero())
        , max(planar_math::vec2_consts<T>::zero()) {}

    AABB2D(const Vec& min_corner, const Vec& max_corner)
        : min(min_corner), max(max_corner) {}

    AABB2D(T min_x, T min_y, T max_x, T max_y)
        : min(min_x, min_y), max(max_x, max_y) {}

    /// Tight box around a point cloud
    /// @throws std::invalid_argument if vertices is empty
    [[nodiscard]] static AABB2D from_vertices(std::span<const Vec> vertices);

    /// Box of a transformed box, using the absolute linear part on the extent
    [[nodiscard]] static AABB2D transformed(const AABB2D& aabb, const Transform2D<T>& transform);

    /// Closed separating-axis test on both axes
    [[nodiscard]] static bool test_overlap(const AABB2D& a, const AABB2D& b) {
        return a.min.x <= b.max.x && a.max.x >= b.min.x && a.min.y <= b.max.y && a.max.y >= b.min.y;
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] T left() const { return min.x; }
    [[nodiscard]] T right() const { return max.x; }
    [[nodiscard]] T top() const { return min.y; }
    [[nodiscard]] T bottom() const { return max.y; }
    [[nodiscard]] T width() const { return max.x - min.x; }
    [[nodiscard]] T height() const { return max.y - min.y; }
    [[nodiscard]] Vec center() const { return planar_math::midpoint(min, max); }

    /// Half-size on each axis
    [[nodiscard]] Vec extents() const {
        const T two = ScalarTraits<T>::from_int(2);
        return Vec((max.x - min.x) / two, (max.y - min.y) / two);
    }

    // =========================================================================
    // Operations
    // =========================================================================

    [[nodiscard]] bool overlaps(const AABB2D& other) const { return test_overlap(*this, other); }

    /// Strictly inside (edges excluded)
    [[nodiscard]] bool contains_strict(const Vec& point) const {
        return point.x > min.x && point.x < max.x && point.y > min.y && point.y < max.y;
    }

    /// Smallest box enclosing both
    [[nodiscard]] AABB2D compose(const AABB2D& other) const {
        return AABB2D(planar_math::min(min, other.min), planar_math::max(max, other.max));
    }

    [[nodiscard]] bool operator==(const AABB2D& other) const { return min == other.min && max == other.max; }
    [[nodiscard]] bool operator!=(const AABB2D& other) const { return !(*this == other); }
};

// =============================================================================
// Implementation
// =============================================================================

template<typename T>
AABB2D<T> AABB2D<T>::from_vertices(std::span<const Vec> vertices) {
    if (vertices.empty()) {
        throw std::invalid_argument("AABB2D::from_vertices requires at least one vertex");
    }

    Vec lo = vertices.front();
    Vec hi = vertices.front();
    for (const auto& v : vertices.subspan(1)) {
        lo = planar_math::min(lo, v);
        hi = planar_math::max(hi, v);
    }
    return AABB2D(lo, hi);
}

template<typename T>
AABB2D<T> AABB2D<T>::transformed(const AABB2D& aabb, const Transform2D<T>& transform) {
    const Vec center = planar_math::transform_point(transform.matrix(), aabb.center());
    const Vec extent = planar_math::transform_normal(planar_math::abs_matrix(transform.matrix()), aabb.extents());
    return AABB2D(center - extent, center + extent);
}

extern template struct AABB2D<float>;
extern template struct AABB2D<Fix64>;

} // namespace planar_collision
