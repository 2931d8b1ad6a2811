#pragma once

/// @file mat.hpp
/// @brief 3x2 affine matrix operations for planar_math
///
/// A TMat3x2 maps p to m[0] * p.x + m[1] * p.y + m[2]. Products follow the
/// row-vector convention: multiply(a, b) applies a first, then b.

#include "types.hpp"
#include "vec.hpp"

#include <stdexcept>

namespace planar_math {

// =============================================================================
// Construction
// =============================================================================

template<typename T>
[[nodiscard]] inline TMat3x2<T> make_matrix(const TVec2<T>& x_axis, const TVec2<T>& y_axis,
                                            const TVec2<T>& translation) {
    return TMat3x2<T>(x_axis, y_axis, translation);
}

template<typename T>
[[nodiscard]] inline TMat3x2<T> identity_matrix() {
    return make_matrix(vec2_consts<T>::unit_x(), vec2_consts<T>::unit_y(), vec2_consts<T>::zero());
}

template<typename T>
[[nodiscard]] inline TMat3x2<T> make_scale(const TVec2<T>& scale) {
    const T z = ScalarTraits<T>::zero();
    return make_matrix(TVec2<T>(scale.x, z), TVec2<T>(z, scale.y), vec2_consts<T>::zero());
}

/// Counter-clockwise rotation in a y-up frame (clockwise on screen with y down)
template<typename T>
[[nodiscard]] inline TMat3x2<T> make_rotation(T radians) {
    const T c = ScalarTraits<T>::cos(radians);
    const T s = ScalarTraits<T>::sin(radians);
    return make_matrix(TVec2<T>(c, s), TVec2<T>(-s, c), vec2_consts<T>::zero());
}

template<typename T>
[[nodiscard]] inline TMat3x2<T> make_translation(const TVec2<T>& position) {
    return make_matrix(vec2_consts<T>::unit_x(), vec2_consts<T>::unit_y(), position);
}

// =============================================================================
// Application
// =============================================================================

/// Transform a point (translation applied)
template<typename T>
[[nodiscard]] inline TVec2<T> transform_point(const TMat3x2<T>& m, const TVec2<T>& p) {
    return TVec2<T>(
        m[0].x * p.x + m[1].x * p.y + m[2].x,
        m[0].y * p.x + m[1].y * p.y + m[2].y);
}

/// Transform a direction (translation ignored)
template<typename T>
[[nodiscard]] inline TVec2<T> transform_normal(const TMat3x2<T>& m, const TVec2<T>& v) {
    return TVec2<T>(
        m[0].x * v.x + m[1].x * v.y,
        m[0].y * v.x + m[1].y * v.y);
}

/// Multiply a direction by the transposed linear part
///
/// Maps a world-space direction to the local direction whose support
/// point is farthest along it (scale and rotation both accounted for).
template<typename T>
[[nodiscard]] inline TVec2<T> transform_normal_transposed(const TMat3x2<T>& m, const TVec2<T>& v) {
    return TVec2<T>(
        m[0].x * v.x + m[0].y * v.y,
        m[1].x * v.x + m[1].y * v.y);
}

// =============================================================================
// Algebra
// =============================================================================

/// a applied first, then b
template<typename T>
[[nodiscard]] inline TMat3x2<T> multiply(const TMat3x2<T>& a, const TMat3x2<T>& b) {
    return make_matrix(
        transform_normal(b, a[0]),
        transform_normal(b, a[1]),
        transform_point(b, a[2]));
}

/// Component-wise absolute value of the linear part; translation kept
template<typename T>
[[nodiscard]] inline TMat3x2<T> abs_matrix(const TMat3x2<T>& m) {
    using S = ScalarTraits<T>;
    return make_matrix(
        TVec2<T>(S::abs(m[0].x), S::abs(m[0].y)),
        TVec2<T>(S::abs(m[1].x), S::abs(m[1].y)),
        m[2]);
}

/// Determinant of the linear part
template<typename T>
[[nodiscard]] inline T determinant(const TMat3x2<T>& m) {
    return m[0].x * m[1].y - m[1].x * m[0].y;
}

/// Affine inverse
/// @throws std::invalid_argument if the linear part is singular
template<typename T>
[[nodiscard]] inline TMat3x2<T> invert(const TMat3x2<T>& m) {
    const T det = determinant(m);
    if (det == ScalarTraits<T>::zero()) {
        throw std::invalid_argument("Cannot invert a singular transform matrix");
    }

    const TVec2<T> x_axis(m[1].y / det, -(m[0].y / det));
    const TVec2<T> y_axis(-(m[1].x / det), m[0].x / det);
    const TMat3x2<T> linear = make_matrix(x_axis, y_axis, vec2_consts<T>::zero());
    const TVec2<T> t = transform_normal(linear, m[2]);
    return make_matrix(x_axis, y_axis, TVec2<T>(-t.x, -t.y));
}

} // namespace planar_math
