#pragma once

/// @file shape.hpp
/// @brief Convex 2D collision shapes for planar_collision
///
/// Shapes are immutable values defined in local space. Placement in the
/// world always comes from a separate Transform2D, so one shape value can
/// be shared by any number of colliders.

#include "fwd.hpp"
#include "types.hpp"
#include "aabb.hpp"

#include <span>
#include <stdexcept>
#include <variant>

namespace planar_collision {

// =============================================================================
// Point
// =============================================================================

/// Single point at the local origin
template<typename T>
class Point {
public:
    using Vec = TVec2<T>;

    [[nodiscard]] static constexpr ShapeType type() noexcept { return ShapeType::Point; }

    [[nodiscard]] AABB2D<T> local_bounds() const { return AABB2D<T>(); }

    [[nodiscard]] AABB2D<T> transformed_bounds(const Transform2D<T>& transform) const {
        return AABB2D<T>::transformed(local_bounds(), transform);
    }

    /// Always the transform's position; the direction is irrelevant
    [[nodiscard]] Vec support(const Vec& /*direction*/, const Transform2D<T>& transform) const {
        return transform.position();
    }

    /// All points are equal
    [[nodiscard]] bool operator==(const Point&) const { return true; }
};

// =============================================================================
// Circle
// =============================================================================

/// Circle centred on the local origin
template<typename T>
class Circle {
public:
    using Vec = TVec2<T>;

    /// @throws std::invalid_argument if radius is negative
    explicit Circle(T radius) : m_radius(radius) {
        if (radius < ScalarTraits<T>::zero()) {
            throw std::invalid_argument("Circle radius must be non-negative");
        }
    }

    explicit Circle(int radius) : Circle(ScalarTraits<T>::from_int(radius)) {}

    [[nodiscard]] static constexpr ShapeType type() noexcept { return ShapeType::Circle; }

    [[nodiscard]] T radius() const noexcept { return m_radius; }

    [[nodiscard]] AABB2D<T> local_bounds() const { return AABB2D<T>(-m_radius, -m_radius, m_radius, m_radius); }

    [[nodiscard]] AABB2D<T> transformed_bounds(const Transform2D<T>& transform) const {
        return AABB2D<T>::transformed(local_bounds(), transform);
    }

    /// Farthest point along direction; a zero direction yields the centre
    ///
    /// Under a non-uniform scale the circle is an ellipse. Its farthest
    /// point along d is the image of radius * normalize(L^T d), with L the
    /// linear part of the transform.
    [[nodiscard]] Vec support(const Vec& direction, const Transform2D<T>& transform) const {
        const auto& m = transform.matrix();
        const Vec local = planar_math::normalize(planar_math::transform_normal_transposed(m, direction)) * m_radius;
        return planar_math::transform_point(m, local);
    }

    [[nodiscard]] bool operator==(const Circle& other) const { return m_radius == other.m_radius; }

private:
    T m_radius;
};

// =============================================================================
// Rectangle
// =============================================================================

/// Rectangle given by its local top-left corner and size
template<typename T>
class Rectangle {
public:
    using Vec = TVec2<T>;

    Rectangle(T left, T top, T width, T height)
        : m_width(width)
        , m_height(height)
        , m_bounds(left, top, left + width, top + height) {}

    Rectangle(int left, int top, int width, int height)
        : Rectangle(ScalarTraits<T>::from_int(left), ScalarTraits<T>::from_int(top),
                    ScalarTraits<T>::from_int(width), ScalarTraits<T>::from_int(height)) {}

    [[nodiscard]] static constexpr ShapeType type() noexcept { return ShapeType::Rectangle; }

    [[nodiscard]] T width() const noexcept { return m_width; }
    [[nodiscard]] T height() const noexcept { return m_height; }
    [[nodiscard]] T left() const { return m_bounds.left(); }
    [[nodiscard]] T right() const { return m_bounds.right(); }
    [[nodiscard]] T top() const { return m_bounds.top(); }
    [[nodiscard]] T bottom() const { return m_bounds.bottom(); }
    [[nodiscard]] const Vec& min() const noexcept { return m_bounds.min; }
    [[nodiscard]] const Vec& max() const noexcept { return m_bounds.max; }
    [[nodiscard]] Vec top_left() const { return m_bounds.min; }
    [[nodiscard]] Vec bottom_right() const { return m_bounds.max; }

    [[nodiscard]] AABB2D<T> local_bounds() const { return m_bounds; }

    [[nodiscard]] AABB2D<T> transformed_bounds(const Transform2D<T>& transform) const {
        return AABB2D<T>::transformed(m_bounds, transform);
    }

    /// Corner farthest along direction
    /// @throws std::invalid_argument if direction is exactly zero
    [[nodiscard]] Vec support(const Vec& direction, const Transform2D<T>& transform) const;

    [[nodiscard]] bool operator==(const Rectangle& other) const {
        return m_bounds.min == other.m_bounds.min && m_bounds.max == other.m_bounds.max;
    }

private:
    /// Corner by direction quadrant (local space)
    [[nodiscard]] Vec local_support(const Vec& direction) const;

    T m_width;
    T m_height;
    AABB2D<T> m_bounds;
};

// =============================================================================
// Line
// =============================================================================

/// Segment between two local points
template<typename T>
class Line {
public:
    using Vec = TVec2<T>;

    Line(const Vec& start, const Vec& end)
        : m_start(start)
        , m_end(end)
        , m_bounds(planar_math::min(start, end), planar_math::max(start, end)) {}

    [[nodiscard]] static constexpr ShapeType type() noexcept { return ShapeType::Line; }

    [[nodiscard]] const Vec& start() const noexcept { return m_start; }
    [[nodiscard]] const Vec& end() const noexcept { return m_end; }

    [[nodiscard]] AABB2D<T> local_bounds() const { return m_bounds; }

    [[nodiscard]] AABB2D<T> transformed_bounds(const Transform2D<T>& transform) const {
        return AABB2D<T>::transformed(m_bounds, transform);
    }

    /// Transformed endpoint with the larger projection (end wins ties)
    [[nodiscard]] Vec support(const Vec& direction, const Transform2D<T>& transform) const {
        const Vec start = planar_math::transform_point(transform.matrix(), m_start);
        const Vec end = planar_math::transform_point(transform.matrix(), m_end);
        return planar_math::dot(start, direction) > planar_math::dot(end, direction) ? start : end;
    }

    /// Endpoint order does not matter
    [[nodiscard]] bool operator==(const Line& other) const {
        return (m_start == other.m_start && m_end == other.m_end) ||
               (m_start == other.m_end && m_end == other.m_start);
    }

private:
    Vec m_start;
    Vec m_end;
    AABB2D<T> m_bounds;
};

// =============================================================================
// Shape
// =============================================================================

/// Value-semantic union of the convex shapes
///
/// A Shape is also the simplest collidable: shapes() yields the shape itself,
/// so code written against collidables accepts a lone shape unchanged.
template<typename T>
class Shape {
public:
    using Vec = TVec2<T>;
    using Variant = std::variant<Point<T>, Circle<T>, Rectangle<T>, Line<T>>;

    Shape(Point<T> point) : m_shape(std::move(point)) {}
    Shape(Circle<T> circle) : m_shape(std::move(circle)) {}
    Shape(Rectangle<T> rectangle) : m_shape(std::move(rectangle)) {}
    Shape(Line<T> line) : m_shape(std::move(line)) {}

    [[nodiscard]] ShapeType type() const {
        return std::visit([](const auto& s) { return s.type(); }, m_shape);
    }

    [[nodiscard]] AABB2D<T> local_bounds() const {
        return std::visit([](const auto& s) { return s.local_bounds(); }, m_shape);
    }

    [[nodiscard]] AABB2D<T> transformed_bounds(const Transform2D<T>& transform) const {
        return std::visit([&](const auto& s) { return s.transformed_bounds(transform); }, m_shape);
    }

    [[nodiscard]] Vec support(const Vec& direction, const Transform2D<T>& transform) const {
        return std::visit([&](const auto& s) { return s.support(direction, transform); }, m_shape);
    }

    /// Single-element view of this shape
    [[nodiscard]] std::span<const Shape, 1> shapes() const noexcept {
        return std::span<const Shape, 1>(this, 1);
    }

    /// Check shape kind
    template<typename S>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<S>(m_shape);
    }

    /// Get as specific kind (nullptr on mismatch)
    template<typename S>
    [[nodiscard]] const S* as() const noexcept {
        return std::get_if<S>(&m_shape);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_shape; }

    /// Structural equality; different kinds never compare equal
    [[nodiscard]] bool operator==(const Shape& other) const { return m_shape == other.m_shape; }
    [[nodiscard]] bool operator!=(const Shape& other) const { return !(*this == other); }

private:
    Variant m_shape;
};

// =============================================================================
// Implementation
// =============================================================================

template<typename T>
TVec2<T> Rectangle<T>::local_support(const Vec& direction) const {
    const T zero = ScalarTraits<T>::zero();
    const Vec& lo = m_bounds.min;
    const Vec& hi = m_bounds.max;

    if (direction.x >= zero && direction.y >= zero) {
        return hi;
    } else if (direction.x >= zero && direction.y < zero) {
        return Vec(hi.x, lo.y);
    } else if (direction.x < zero && direction.y >= zero) {
        return Vec(lo.x, hi.y);
    }
    return lo;
}

template<typename T>
TVec2<T> Rectangle<T>::support(const Vec& direction, const Transform2D<T>& transform) const {
    if (planar_math::is_zero(direction)) {
        throw std::invalid_argument("Rectangle support direction cannot be zero");
    }

    const auto& matrix = transform.matrix();
    const Vec local_direction = planar_math::transform_normal(planar_math::invert(matrix), direction);
    return planar_math::transform_point(matrix, local_support(local_direction));
}

extern template class Point<float>;
extern template class Point<Fix64>;
extern template class Circle<float>;
extern template class Circle<Fix64>;
extern template class Rectangle<float>;
extern template class Rectangle<Fix64>;
extern template class Line<float>;
extern template class Line<Fix64>;
extern template class Shape<float>;
extern template class Shape<Fix64>;

} // namespace planar_collision
