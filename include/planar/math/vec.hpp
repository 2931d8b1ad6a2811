#pragma once

/// @file vec.hpp
/// @brief 2D vector operations for planar_math
///
/// GLM's geometric functions only accept IEEE scalars, so these helpers are
/// written against ScalarTraits and work for float and Fix64 alike.

#include "types.hpp"

namespace planar_math {

// =============================================================================
// Core Vector Operations
// =============================================================================

/// Dot product of two vectors
template<typename T>
[[nodiscard]] inline T dot(const TVec2<T>& a, const TVec2<T>& b) {
    return a.x * b.x + a.y * b.y;
}

/// Z component of the 3D cross product of (a, 0) and (b, 0)
template<typename T>
[[nodiscard]] inline T cross(const TVec2<T>& a, const TVec2<T>& b) {
    return a.x * b.y - a.y * b.x;
}

/// (a x b) x c with both vectors embedded at z = 0
///
/// triple_product(a, b, a) is the component of b perpendicular to a,
/// which is the GJK "perpendicular toward b" direction.
template<typename T>
[[nodiscard]] inline TVec2<T> triple_product(const TVec2<T>& a, const TVec2<T>& b, const TVec2<T>& c) {
    const T k = cross(a, b);
    return TVec2<T>(-(k * c.y), k * c.x);
}

/// Squared length of a vector
template<typename T>
[[nodiscard]] inline T length_squared(const TVec2<T>& v) {
    return dot(v, v);
}

/// Length of a vector
template<typename T>
[[nodiscard]] inline T length(const TVec2<T>& v) {
    return ScalarTraits<T>::sqrt(length_squared(v));
}

/// Check for the exact zero vector
template<typename T>
[[nodiscard]] inline bool is_zero(const TVec2<T>& v) {
    return v.x == ScalarTraits<T>::zero() && v.y == ScalarTraits<T>::zero();
}

/// Normalize a vector; the zero vector is returned unchanged
///
/// The vector is first divided by its largest component so the squared
/// length lies in [1, 2]. Fix64 would otherwise square tiny components
/// to zero and saturate large ones.
template<typename T>
[[nodiscard]] inline TVec2<T> normalize(const TVec2<T>& v) {
    using S = ScalarTraits<T>;
    const T scale = S::max(S::abs(v.x), S::abs(v.y));
    if (scale == S::zero()) {
        return v;
    }
    const TVec2<T> unit_box(v.x / scale, v.y / scale);
    const T len = length(unit_box);
    return TVec2<T>(unit_box.x / len, unit_box.y / len);
}

// =============================================================================
// Vec2 Utilities
// =============================================================================

/// Rotate 90 degrees: (x, y) -> (y, -x)
template<typename T>
[[nodiscard]] inline TVec2<T> perpendicular(const TVec2<T>& v) {
    return TVec2<T>(v.y, -v.x);
}

/// Component-wise product
template<typename T>
[[nodiscard]] inline TVec2<T> mul(const TVec2<T>& a, const TVec2<T>& b) {
    return TVec2<T>(a.x * b.x, a.y * b.y);
}

/// Component-wise minimum
template<typename T>
[[nodiscard]] inline TVec2<T> min(const TVec2<T>& a, const TVec2<T>& b) {
    return TVec2<T>(ScalarTraits<T>::min(a.x, b.x), ScalarTraits<T>::min(a.y, b.y));
}

/// Component-wise maximum
template<typename T>
[[nodiscard]] inline TVec2<T> max(const TVec2<T>& a, const TVec2<T>& b) {
    return TVec2<T>(ScalarTraits<T>::max(a.x, b.x), ScalarTraits<T>::max(a.y, b.y));
}

/// Component-wise clamp
template<typename T>
[[nodiscard]] inline TVec2<T> clamp(const TVec2<T>& v, const TVec2<T>& lo, const TVec2<T>& hi) {
    return TVec2<T>(ScalarTraits<T>::clamp(v.x, lo.x, hi.x), ScalarTraits<T>::clamp(v.y, lo.y, hi.y));
}

/// Midpoint of two vectors
template<typename T>
[[nodiscard]] inline TVec2<T> midpoint(const TVec2<T>& a, const TVec2<T>& b) {
    const T two = ScalarTraits<T>::from_int(2);
    return TVec2<T>((a.x + b.x) / two, (a.y + b.y) / two);
}

/// Convert to a float vector (for logging and rendering)
template<typename T>
[[nodiscard]] inline Vec2 to_float(const TVec2<T>& v) {
    return Vec2(ScalarTraits<T>::to_float(v.x), ScalarTraits<T>::to_float(v.y));
}

} // namespace planar_math
