#pragma once

/// @file collision.hpp
/// @brief Main include for planar_collision
///
/// Two-dimensional convex collision: shapes with support mappings, closed-form
/// fast paths, GJK overlap, EPA penetration depth and a uniform-grid broad phase.
/// Every type is a template over the scalar; f32 and fixed bind the whole API
/// to float and Fix64 so both flavours read the same at the call site.
///
/// @code
/// using namespace planar_collision::fixed;
///
/// Shape a = Circle(5);
/// Shape b = Rectangle(0, 0, 10, 10);
/// Transform2D ta(Vec2(Fix64(-3), Fix64(5)));
///
/// auto gjk = NarrowPhase::find_collision_simplex(a, ta, b, Transform2D::identity());
/// if (gjk.intersecting) {
///     Vec2 mtv = NarrowPhase::intersect(a, ta, b, Transform2D::identity(), gjk.simplex);
/// }
/// @endcode

#include "fwd.hpp"
#include "types.hpp"
#include "aabb.hpp"
#include "shape.hpp"
#include "minkowski.hpp"
#include "simplex.hpp"
#include "narrow_phase.hpp"
#include "spatial_hash.hpp"
#include "config.hpp"

namespace planar_collision {

/// Single-precision API
namespace f32 {
    using Scalar = float;
    using Vec2 = TVec2<float>;
    using AABB2D = planar_collision::AABB2D<float>;
    using Point = planar_collision::Point<float>;
    using Circle = planar_collision::Circle<float>;
    using Rectangle = planar_collision::Rectangle<float>;
    using Line = planar_collision::Line<float>;
    using Shape = planar_collision::Shape<float>;
    using Transform2D = planar_collision::Transform2D<float>;
    using MinkowskiDifference = planar_collision::MinkowskiDifference<float>;
    using Simplex2D = planar_collision::Simplex2D<float>;
    using GjkResult = planar_collision::GjkResult<float>;
    using EpaSettings = planar_collision::EpaSettings<float>;
    using NarrowPhase = planar_collision::NarrowPhase<float>;

    template<typename Id, typename Hash = std::hash<Id>>
    using SpatialHash2D = planar_collision::SpatialHash2D<Id, float, Hash>;
} // namespace f32

/// Deterministic Q31.32 API
namespace fixed {
    using Scalar = Fix64;
    using Vec2 = TVec2<Fix64>;
    using AABB2D = planar_collision::AABB2D<Fix64>;
    using Point = planar_collision::Point<Fix64>;
    using Circle = planar_collision::Circle<Fix64>;
    using Rectangle = planar_collision::Rectangle<Fix64>;
    using Line = planar_collision::Line<Fix64>;
    using Shape = planar_collision::Shape<Fix64>;
    using Transform2D = planar_collision::Transform2D<Fix64>;
    using MinkowskiDifference = planar_collision::MinkowskiDifference<Fix64>;
    using Simplex2D = planar_collision::Simplex2D<Fix64>;
    using GjkResult = planar_collision::GjkResult<Fix64>;
    using EpaSettings = planar_collision::EpaSettings<Fix64>;
    using NarrowPhase = planar_collision::NarrowPhase<Fix64>;

    template<typename Id, typename Hash = std::hash<Id>>
    using SpatialHash2D = planar_collision::SpatialHash2D<Id, Fix64, Hash>;
} // namespace fixed

} // namespace planar_collision

namespace pcol = planar_collision;
