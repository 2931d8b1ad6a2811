#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for planar_collision

#include <cstdint>
#include <functional>

namespace planar_collision {

// =============================================================================
// Enums
// =============================================================================

enum class ShapeType : std::uint8_t;

// =============================================================================
// Geometry
// =============================================================================

template<typename T> struct AABB2D;
template<typename T> class Point;
template<typename T> class Circle;
template<typename T> class Rectangle;
template<typename T> class Line;
template<typename T> class Shape;

// =============================================================================
// Narrow Phase
// =============================================================================

template<typename T> class MinkowskiDifference;
template<typename T> class Simplex2D;
template<typename T> struct GjkResult;
template<typename T> struct EpaSettings;
template<typename T> class NarrowPhase;

// =============================================================================
// Broad Phase
// =============================================================================

template<typename Id, typename T, typename Hash = std::hash<Id>>
class SpatialHash2D;

// =============================================================================
// Configuration
// =============================================================================

struct CollisionConfig;

} // namespace planar_collision
