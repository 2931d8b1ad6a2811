#pragma once

/// @file narrow_phase.hpp
/// @brief Exact 2D overlap tests for planar_collision
///
/// test_collision() takes a closed-form fast path whenever the shape pair
/// and transforms allow it and otherwise runs GJK over the Minkowski
/// difference. intersect() runs EPA on a GJK simplex to recover the
/// minimum translation vector.

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"
#include "simplex.hpp"
#include "minkowski.hpp"

#include <vector>

namespace planar_collision {

// =============================================================================
// GJK Result
// =============================================================================

/// Result of the GJK intersection test
template<typename T>
struct GjkResult {
    bool intersecting = false;  ///< Shapes overlap
    Simplex2D<T> simplex;       ///< Enclosing 2-simplex when intersecting, empty otherwise
};

// =============================================================================
// Narrow Phase
// =============================================================================

/// Shape-pair collision queries
template<typename T>
class NarrowPhase {
public:
    using Vec = TVec2<T>;

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Overlap test with fast paths, falling back to GJK
    [[nodiscard]] static bool test_collision(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                                             const Shape<T>& shape_b, const Transform2D<T>& transform_b);

    /// True when any shape of a overlaps any shape of b
    ///
    /// A collidable is anything with a shapes() range of Shape<T>.
    template<typename CollidableA, typename CollidableB>
    [[nodiscard]] static bool test_collision(const CollidableA& collidable_a, const Transform2D<T>& transform_a,
                                             const CollidableB& collidable_b, const Transform2D<T>& transform_b) {
        for (const Shape<T>& shape_a : collidable_a.shapes()) {
            for (const Shape<T>& shape_b : collidable_b.shapes()) {
                if (test_collision(shape_a, transform_a, shape_b, transform_b)) {
                    return true;
                }
            }
        }
        return false;
    }

    // =========================================================================
    // Fast Paths
    // =========================================================================

    /// Both rectangles must be axis-aligned; touching counts
    [[nodiscard]] static bool test_rectangle_overlap(const Rectangle<T>& rectangle_a, const Transform2D<T>& transform_a,
                                                     const Rectangle<T>& rectangle_b, const Transform2D<T>& transform_b);

    /// Rectangle must be axis-aligned; a point on an edge is outside
    [[nodiscard]] static bool test_point_rectangle_overlap(const Point<T>& point, const Transform2D<T>& point_transform,
                                                           const Rectangle<T>& rectangle,
                                                           const Transform2D<T>& rectangle_transform);

    /// Circle scale must be uniform; a point on the circumference is outside
    [[nodiscard]] static bool test_circle_point_overlap(const Circle<T>& circle, const Transform2D<T>& circle_transform,
                                                        const Point<T>& point, const Transform2D<T>& point_transform);

    /// Rectangle axis-aligned, circle scale uniform; touching counts
    [[nodiscard]] static bool test_circle_rectangle_overlap(const Circle<T>& circle,
                                                            const Transform2D<T>& circle_transform,
                                                            const Rectangle<T>& rectangle,
                                                            const Transform2D<T>& rectangle_transform);

    /// Both circle scales uniform; touching counts
    [[nodiscard]] static bool test_circle_overlap(const Circle<T>& circle_a, const Transform2D<T>& transform_a,
                                                  const Circle<T>& circle_b, const Transform2D<T>& transform_b);

    // =========================================================================
    // GJK / EPA
    // =========================================================================

    /// GJK over the Minkowski difference A - B
    ///
    /// Touching counts as intersecting, except for a Point against a
    /// Rectangle or Circle: a point on their boundary is outside, matching
    /// the point fast paths.
    [[nodiscard]] static GjkResult<T> find_collision_simplex(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                                                             const Shape<T>& shape_b, const Transform2D<T>& transform_b);

    /// EPA: penetration vector of A into B
    ///
    /// Returns the point of the A - B boundary nearest the origin.
    /// Translating A by its negation separates the shapes.
    /// Expands the enclosing simplex toward the Minkowski boundary until the
    /// closest edge stops moving by more than settings.epsilon. After
    /// settings.max_iterations the current estimate is returned as is.
    /// @throws std::invalid_argument if simplex is not a 2-simplex
    [[nodiscard]] static Vec intersect(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                                       const Shape<T>& shape_b, const Transform2D<T>& transform_b,
                                       const Simplex2D<T>& simplex,
                                       const EpaSettings<T>& settings = EpaSettings<T>::defaults());

private:
    /// Polygon edge nearest the origin
    struct Edge {
        T distance;
        Vec normal;
        std::size_t index;  ///< Insertion position for the next vertex
    };

    /// One GJK refinement step
    struct SimplexStep {
        bool encloses_origin;
        Simplex2D<T> simplex;
        Vec direction;
    };

    [[nodiscard]] static Edge find_closest_edge(const std::vector<Vec>& polygon);
    [[nodiscard]] static SimplexStep encloses_origin(const Vec& a, const Simplex2D<T>& simplex);
    [[nodiscard]] static SimplexStep handle_zero_simplex(const Vec& a, const Vec& b);
    [[nodiscard]] static SimplexStep handle_one_simplex(const Vec& a, const Vec& b, const Vec& c);
    [[nodiscard]] static bool collinear_contains_origin(const Vec& a, const Vec& b, const Vec& c);

    /// True if the origin, known to lie in triangle abc, is on the boundary of A - B
    [[nodiscard]] static bool origin_on_boundary(const MinkowskiDifference<T>& minkowski,
                                                 const Vec& a, const Vec& b, const Vec& c);

    /// Perpendicular to a toward b, or a rotated 90 degrees when they are collinear
    [[nodiscard]] static Vec direction_toward(const Vec& a, const Vec& b);
    [[nodiscard]] static bool same_direction(const Vec& a, const Vec& b);
};

extern template class NarrowPhase<float>;
extern template class NarrowPhase<Fix64>;

} // namespace planar_collision
