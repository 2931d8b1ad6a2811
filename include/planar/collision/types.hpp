#pragma once

/// @file types.hpp
/// @brief Core types and constants for planar_collision

#include "fwd.hpp"

#include <planar/math/math.hpp>

#include <cstdint>

namespace planar_collision {

using planar_math::Fix64;
using planar_math::ScalarTraits;
using planar_math::TVec2;
using planar_math::TMat3x2;
using planar_math::Transform2D;

// =============================================================================
// Constants
// =============================================================================

/// EPA convergence tolerance, as numerator / denominator of the scalar type
constexpr int k_epa_epsilon_numerator = 1;
constexpr int k_epa_epsilon_denominator = 10000;

/// Maximum EPA iterations before the last estimate is accepted
constexpr int k_max_epa_iterations = 32;

/// Safety bound on GJK refinement steps
constexpr int k_max_gjk_iterations = 64;

// =============================================================================
// Shape Type
// =============================================================================

/// Shape type enumeration
enum class ShapeType : std::uint8_t {
    Point,
    Circle,
    Rectangle,
    Line,
};

/// Get shape type name
[[nodiscard]] inline const char* shape_type_name(ShapeType type) {
    switch (type) {
        case ShapeType::Point: return "Point";
        case ShapeType::Circle: return "Circle";
        case ShapeType::Rectangle: return "Rectangle";
        case ShapeType::Line: return "Line";
        default: return "Unknown";
    }
}

// =============================================================================
// Collision Groups
// =============================================================================

/// Bitmask of caller-defined collision groups
using CollisionGroups = std::uint32_t;

/// Predefined group masks
namespace groups {
    constexpr CollisionGroups None = 0u;
    constexpr CollisionGroups All  = ~0u;
} // namespace groups

/// Two masks interact when they share any bit
[[nodiscard]] constexpr bool groups_intersect(CollisionGroups a, CollisionGroups b) noexcept {
    return (a & b) != 0;
}

// =============================================================================
// EPA Settings
// =============================================================================

/// Convergence parameters for the penetration solver
template<typename T>
struct EpaSettings {
    T epsilon;              ///< Stop when a new support point moves the edge less than this
    int max_iterations;     ///< Accept the current estimate after this many expansions

    [[nodiscard]] static EpaSettings defaults() {
        return EpaSettings{
            ScalarTraits<T>::from_fraction(k_epa_epsilon_numerator, k_epa_epsilon_denominator),
            k_max_epa_iterations};
    }
};

} // namespace planar_collision
