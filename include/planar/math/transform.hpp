#pragma once

/// @file transform.hpp
/// @brief 2D position / rotation / scale transform for planar_math

#include "types.hpp"
#include "vec.hpp"
#include "mat.hpp"

namespace planar_math {

/// Immutable 2D transform with a lazily built affine matrix
///
/// The matrix is scale, then rotation, then translation. It is computed on
/// first access and cached; the cache never affects equality. A cached
/// transform must not be shared across threads before its first matrix()
/// call.
template<typename T>
class Transform2D {
public:
    using Scalar = T;
    using Vec = TVec2<T>;
    using Mat = TMat3x2<T>;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Identity transform
    Transform2D()
        : Transform2D(vec2_consts<T>::zero(), ScalarTraits<T>::zero(), vec2_consts<T>::one()) {}

    explicit Transform2D(const Vec& position)
        : Transform2D(position, ScalarTraits<T>::zero(), vec2_consts<T>::one()) {}

    Transform2D(const Vec& position, T rotation)
        : Transform2D(position, rotation, vec2_consts<T>::one()) {}

    Transform2D(const Vec& position, T rotation, const Vec& scale)
        : m_position(position)
        , m_rotation(rotation)
        , m_scale(scale) {}

    [[nodiscard]] static const Transform2D& identity() {
        static const Transform2D IDENTITY_TRANSFORM;
        return IDENTITY_TRANSFORM;
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const Vec& position() const noexcept { return m_position; }
    [[nodiscard]] T rotation() const noexcept { return m_rotation; }
    [[nodiscard]] const Vec& scale() const noexcept { return m_scale; }

    /// Composite matrix (computed once)
    [[nodiscard]] const Mat& matrix() const;

    /// Rotation is a whole multiple of PI/2
    [[nodiscard]] bool is_axis_aligned() const;

    /// Scale is equal on both axes
    [[nodiscard]] bool is_uniform_scale() const { return m_scale.x == m_scale.y; }

    // =========================================================================
    // Builders
    // =========================================================================

    [[nodiscard]] Transform2D with_position(const Vec& position) const {
        return Transform2D(position, m_rotation, m_scale);
    }

    [[nodiscard]] Transform2D with_rotation(T rotation) const {
        return Transform2D(m_position, rotation, m_scale);
    }

    [[nodiscard]] Transform2D with_scale(const Vec& scale) const {
        return Transform2D(m_position, m_rotation, scale);
    }

    /// Additive composition: positions and rotations add, scales multiply.
    /// This is not the matrix product of the two transforms; the position of
    /// `other` is not rotated or scaled by this transform.
    [[nodiscard]] Transform2D compose(const Transform2D& other) const;

    // =========================================================================
    // Application
    // =========================================================================

    [[nodiscard]] Vec transform_point(const Vec& p) const { return planar_math::transform_point(matrix(), p); }
    [[nodiscard]] Vec transform_direction(const Vec& v) const { return transform_normal(matrix(), v); }

    [[nodiscard]] bool operator==(const Transform2D& other) const {
        return m_position == other.m_position && m_rotation == other.m_rotation && m_scale == other.m_scale;
    }

    [[nodiscard]] bool operator!=(const Transform2D& other) const { return !(*this == other); }

private:
    Vec m_position;
    T m_rotation;
    Vec m_scale;

    mutable Mat m_matrix;
    mutable bool m_matrix_cached = false;
};

// =============================================================================
// Implementation
// =============================================================================

template<typename T>
const typename Transform2D<T>::Mat& Transform2D<T>::matrix() const {
    if (!m_matrix_cached) {
        m_matrix = multiply(multiply(make_scale(m_scale), make_rotation(m_rotation)), make_translation(m_position));
        m_matrix_cached = true;
    }
    return m_matrix;
}

template<typename T>
bool Transform2D<T>::is_axis_aligned() const {
    return ScalarTraits<T>::remainder(m_rotation, ScalarTraits<T>::half_pi()) == ScalarTraits<T>::zero();
}

template<typename T>
Transform2D<T> Transform2D<T>::compose(const Transform2D& other) const {
    return Transform2D(m_position + other.m_position, m_rotation + other.m_rotation, mul(m_scale, other.m_scale));
}

extern template class Transform2D<float>;
extern template class Transform2D<Fix64>;

} // namespace planar_math
