/// @file narrow_phase.cpp
/// @brief Fast paths, GJK and EPA for planar_collision

#include <planar/collision/narrow_phase.hpp>
#include <planar/core/log.hpp>

#include <stdexcept>

namespace planar_collision {

using planar_math::cross;
using planar_math::dot;
using planar_math::triple_product;

namespace {

/// Uniform-scale circle radius in world units
template<typename T>
T world_radius(const Circle<T>& circle, const Transform2D<T>& transform) {
    return circle.radius() * ScalarTraits<T>::abs(transform.scale().x);
}

/// A point inside a solid shape must be strictly interior, as in the
/// point fast paths. Points and lines have no interior, so touching them
/// still counts.
template<typename T>
bool strict_containment(const Shape<T>& point, const Shape<T>& solid) {
    return point.template is<Point<T>>() &&
           (solid.template is<Rectangle<T>>() || solid.template is<Circle<T>>());
}

} // anonymous namespace

// =============================================================================
// Dispatch
// =============================================================================

template<typename T>
bool NarrowPhase<T>::test_collision(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                                    const Shape<T>& shape_b, const Transform2D<T>& transform_b) {
    const auto* rect_a = shape_a.template as<Rectangle<T>>();
    const auto* rect_b = shape_b.template as<Rectangle<T>>();
    const auto* circle_a = shape_a.template as<Circle<T>>();
    const auto* circle_b = shape_b.template as<Circle<T>>();
    const auto* point_a = shape_a.template as<Point<T>>();
    const auto* point_b = shape_b.template as<Point<T>>();

    if (rect_a && rect_b && transform_a.is_axis_aligned() && transform_b.is_axis_aligned()) {
        return test_rectangle_overlap(*rect_a, transform_a, *rect_b, transform_b);
    }
    if (point_a && rect_b && transform_b.is_axis_aligned()) {
        return test_point_rectangle_overlap(*point_a, transform_a, *rect_b, transform_b);
    }
    if (rect_a && point_b && transform_a.is_axis_aligned()) {
        return test_point_rectangle_overlap(*point_b, transform_b, *rect_a, transform_a);
    }
    if (rect_a && circle_b && transform_a.is_axis_aligned() && transform_b.is_uniform_scale()) {
        return test_circle_rectangle_overlap(*circle_b, transform_b, *rect_a, transform_a);
    }
    if (circle_a && rect_b && transform_a.is_uniform_scale() && transform_b.is_axis_aligned()) {
        return test_circle_rectangle_overlap(*circle_a, transform_a, *rect_b, transform_b);
    }
    if (circle_a && point_b && transform_a.is_uniform_scale()) {
        return test_circle_point_overlap(*circle_a, transform_a, *point_b, transform_b);
    }
    if (point_a && circle_b && transform_b.is_uniform_scale()) {
        return test_circle_point_overlap(*circle_b, transform_b, *point_a, transform_a);
    }
    if (circle_a && circle_b && transform_a.is_uniform_scale() && transform_b.is_uniform_scale()) {
        return test_circle_overlap(*circle_a, transform_a, *circle_b, transform_b);
    }

    return find_collision_simplex(shape_a, transform_a, shape_b, transform_b).intersecting;
}

// =============================================================================
// Fast Paths
// =============================================================================

template<typename T>
bool NarrowPhase<T>::test_rectangle_overlap(const Rectangle<T>& rectangle_a, const Transform2D<T>& transform_a,
                                            const Rectangle<T>& rectangle_b, const Transform2D<T>& transform_b) {
    return AABB2D<T>::test_overlap(rectangle_a.transformed_bounds(transform_a),
                                   rectangle_b.transformed_bounds(transform_b));
}

template<typename T>
bool NarrowPhase<T>::test_point_rectangle_overlap(const Point<T>& /*point*/, const Transform2D<T>& point_transform,
                                                  const Rectangle<T>& rectangle,
                                                  const Transform2D<T>& rectangle_transform) {
    return rectangle.transformed_bounds(rectangle_transform).contains_strict(point_transform.position());
}

template<typename T>
bool NarrowPhase<T>::test_circle_point_overlap(const Circle<T>& circle, const Transform2D<T>& circle_transform,
                                               const Point<T>& /*point*/, const Transform2D<T>& point_transform) {
    const T radius = world_radius(circle, circle_transform);
    const Vec offset = circle_transform.position() - point_transform.position();
    return planar_math::length_squared(offset) < radius * radius;
}

template<typename T>
bool NarrowPhase<T>::test_circle_rectangle_overlap(const Circle<T>& circle, const Transform2D<T>& circle_transform,
                                                   const Rectangle<T>& rectangle,
                                                   const Transform2D<T>& rectangle_transform) {
    const Vec& center = circle_transform.position();
    const T radius = world_radius(circle, circle_transform);
    const AABB2D<T> bounds = rectangle.transformed_bounds(rectangle_transform);

    const Vec closest = planar_math::clamp(center, bounds.min, bounds.max);
    return planar_math::length_squared(center - closest) <= radius * radius;
}

template<typename T>
bool NarrowPhase<T>::test_circle_overlap(const Circle<T>& circle_a, const Transform2D<T>& transform_a,
                                         const Circle<T>& circle_b, const Transform2D<T>& transform_b) {
    const T radius_sum = world_radius(circle_a, transform_a) + world_radius(circle_b, transform_b);
    const T distance_squared = planar_math::length_squared(transform_a.position() - transform_b.position());
    return distance_squared <= radius_sum * radius_sum;
}

// =============================================================================
// GJK
// =============================================================================

template<typename T>
GjkResult<T> NarrowPhase<T>::find_collision_simplex(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                                                    const Shape<T>& shape_b, const Transform2D<T>& transform_b) {
    const MinkowskiDifference<T> minkowski(shape_a, transform_a, shape_b, transform_b);
    const Vec unit_x = planar_math::vec2_consts<T>::unit_x();

    const Vec c = minkowski.support(unit_x);
    const Vec b = minkowski.support(-unit_x);

    Simplex2D<T> simplex;
    Vec direction;
    if (c == b) {
        simplex = Simplex2D<T>(c);
        direction = -c;
    } else {
        simplex = Simplex2D<T>(b, c);
        direction = direction_toward(c - b, -c);
    }

    const bool strict = strict_containment(shape_a, shape_b) || strict_containment(shape_b, shape_a);

    for (int i = 0; i < k_max_gjk_iterations; ++i) {
        // Only a single vertex sitting on the origin produces a zero direction
        if (planar_math::is_zero(direction)) {
            if (strict) {
                return GjkResult<T>{};
            }
            const Vec touch = simplex.a();
            return GjkResult<T>{true, Simplex2D<T>(touch, touch, touch)};
        }

        const Vec a = minkowski.support(direction);

        // The new point did not pass the origin: A - B cannot contain it
        const T reach = dot(a, direction);
        if (reach < ScalarTraits<T>::zero() || (strict && reach == ScalarTraits<T>::zero())) {
            return GjkResult<T>{};
        }

        SimplexStep step = encloses_origin(a, simplex);
        if (step.encloses_origin) {
            if (strict && origin_on_boundary(minkowski, simplex.a(), simplex.b(), a)) {
                return GjkResult<T>{};
            }
            return GjkResult<T>{true, Simplex2D<T>(simplex.a(), simplex.b(), a)};
        }

        simplex = step.simplex;
        direction = step.direction;
    }

    planar_core::collision_logger()->debug("GJK did not settle after {} iterations, reporting no contact",
                                           k_max_gjk_iterations);
    return GjkResult<T>{};
}

template<typename T>
typename NarrowPhase<T>::SimplexStep NarrowPhase<T>::encloses_origin(const Vec& a, const Simplex2D<T>& simplex) {
    if (simplex.zero_simplex()) {
        return handle_zero_simplex(a, simplex.a());
    }
    if (simplex.one_simplex()) {
        return handle_one_simplex(a, simplex.a(), simplex.b());
    }
    return SimplexStep{false, simplex, planar_math::vec2_consts<T>::zero()};
}

template<typename T>
typename NarrowPhase<T>::SimplexStep NarrowPhase<T>::handle_zero_simplex(const Vec& a, const Vec& b) {
    const Vec ab = b - a;
    const Vec a0 = -a;

    if (same_direction(ab, a0)) {
        return SimplexStep{false, Simplex2D<T>(a, b), direction_toward(ab, a0)};
    }
    return SimplexStep{false, Simplex2D<T>(a), a0};
}

template<typename T>
typename NarrowPhase<T>::SimplexStep NarrowPhase<T>::handle_one_simplex(const Vec& a, const Vec& b, const Vec& c) {
    const Vec a0 = -a;
    const Vec ab = b - a;
    const Vec ac = c - a;

    if (cross(ab, ac) == ScalarTraits<T>::zero()) {
        // Flat triangle: the origin is on its supporting line
        if (collinear_contains_origin(a, b, c)) {
            return SimplexStep{true, Simplex2D<T>(b, c), a0};
        }
        return SimplexStep{false, Simplex2D<T>(a), a0};
    }

    const Vec abp = triple_product(ab, -ac, ab);
    const Vec acp = triple_product(ac, -ab, ac);

    if (same_direction(abp, a0)) {
        if (same_direction(ab, a0)) {
            return SimplexStep{false, Simplex2D<T>(a, b), abp};
        }
        return SimplexStep{false, Simplex2D<T>(a), a0};
    }
    if (same_direction(acp, a0)) {
        if (same_direction(ac, a0)) {
            return SimplexStep{false, Simplex2D<T>(a, c), acp};
        }
        return SimplexStep{false, Simplex2D<T>(a), a0};
    }
    return SimplexStep{true, Simplex2D<T>(b, c), a0};
}

template<typename T>
bool NarrowPhase<T>::collinear_contains_origin(const Vec& a, const Vec& b, const Vec& c) {
    const Vec ab = b - a;
    const Vec ac = c - a;
    const Vec axis = planar_math::length_squared(ab) >= planar_math::length_squared(ac) ? ab : ac;

    if (planar_math::is_zero(axis)) {
        return planar_math::is_zero(a);
    }
    if (cross(axis, a) != ScalarTraits<T>::zero()) {
        return false;
    }

    const T pa = dot(a, axis);
    const T pb = dot(b, axis);
    const T pc = dot(c, axis);
    const T lo = ScalarTraits<T>::min(pa, ScalarTraits<T>::min(pb, pc));
    const T hi = ScalarTraits<T>::max(pa, ScalarTraits<T>::max(pb, pc));
    return lo <= ScalarTraits<T>::zero() && ScalarTraits<T>::zero() <= hi;
}

template<typename T>
bool NarrowPhase<T>::origin_on_boundary(const MinkowskiDifference<T>& minkowski,
                                        const Vec& a, const Vec& b, const Vec& c) {
    // Support points lie on the boundary of A - B
    if (planar_math::is_zero(a) || planar_math::is_zero(b) || planar_math::is_zero(c)) {
        return true;
    }
    // Three collinear boundary points span a flat face
    if (cross(b - a, c - a) == ScalarTraits<T>::zero()) {
        return true;
    }

    const Vec corners[3] = {a, b, c};
    for (int i = 0; i < 3; ++i) {
        const Vec& p = corners[i];
        const Vec& q = corners[(i + 1) % 3];
        const Vec& r = corners[(i + 2) % 3];

        const Vec edge = q - p;
        if (cross(edge, p) != ScalarTraits<T>::zero()) {
            continue;
        }

        // The origin is on this edge: it is on the boundary only if nothing
        // of A - B lies beyond the edge
        Vec outward = planar_math::perpendicular(edge);
        if (dot(outward, r - p) > ScalarTraits<T>::zero()) {
            outward = -outward;
        }
        if (dot(minkowski.support(outward), outward) <= ScalarTraits<T>::zero()) {
            return true;
        }
    }
    return false;
}

template<typename T>
TVec2<T> NarrowPhase<T>::direction_toward(const Vec& a, const Vec& b) {
    const Vec d = triple_product(a, b, a);
    return planar_math::is_zero(d) ? planar_math::perpendicular(a) : d;
}

template<typename T>
bool NarrowPhase<T>::same_direction(const Vec& a, const Vec& b) {
    return dot(a, b) > ScalarTraits<T>::zero();
}

// =============================================================================
// EPA
// =============================================================================

template<typename T>
TVec2<T> NarrowPhase<T>::intersect(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                                   const Shape<T>& shape_b, const Transform2D<T>& transform_b,
                                   const Simplex2D<T>& simplex, const EpaSettings<T>& settings) {
    if (!simplex.two_simplex()) {
        throw std::invalid_argument("EPA requires a 2-simplex (three points)");
    }

    const MinkowskiDifference<T> minkowski(shape_a, transform_a, shape_b, transform_b);
    std::vector<Vec> polygon(simplex.begin(), simplex.end());
    polygon.reserve(static_cast<std::size_t>(settings.max_iterations) + 3);

    Vec intersection = planar_math::vec2_consts<T>::zero();

    for (int i = 0; i < settings.max_iterations; ++i) {
        const Edge edge = find_closest_edge(polygon);

        // Every edge collapsed to a point: the shapes only touch
        if (planar_math::is_zero(edge.normal)) {
            return planar_math::vec2_consts<T>::zero();
        }

        const Vec support = minkowski.support(edge.normal);
        const T distance = dot(support, edge.normal);

        intersection = edge.normal * distance;

        if (ScalarTraits<T>::abs(distance - edge.distance) <= settings.epsilon) {
            return intersection;
        }

        polygon.insert(polygon.begin() + static_cast<std::ptrdiff_t>(edge.index), support);
    }

    const auto estimate = planar_math::to_float(intersection);
    planar_core::collision_logger()->debug(
        "EPA reached {} iterations without converging, using estimate ({}, {})",
        settings.max_iterations, estimate.x, estimate.y);
    return intersection;
}

template<typename T>
typename NarrowPhase<T>::Edge NarrowPhase<T>::find_closest_edge(const std::vector<Vec>& polygon) {
    const std::size_t count = polygon.size();

    Edge closest{ScalarTraits<T>::max_value(), planar_math::vec2_consts<T>::zero(), 0};

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t j = (i + 1) % count;
        const Vec& a = polygon[i];
        const Vec& b = polygon[j];

        const Vec edge = b - a;
        if (planar_math::is_zero(edge)) {
            continue;
        }

        // Orient the edge normal away from the origin, or away from the
        // rest of the polygon when the origin lies on the edge's line
        Vec n = planar_math::perpendicular(edge);
        const T side = dot(n, a);
        if (side < ScalarTraits<T>::zero()) {
            n = -n;
        } else if (side == ScalarTraits<T>::zero()) {
            const Vec& other = polygon[(j + 1) % count];
            if (dot(n, other - a) > ScalarTraits<T>::zero()) {
                n = -n;
            }
        }
        n = planar_math::normalize(n);

        const T d = dot(n, a);

        if (d < closest.distance) {
            closest = Edge{d, n, j};
        }
    }

    return closest;
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class NarrowPhase<float>;
template class NarrowPhase<Fix64>;

} // namespace planar_collision
