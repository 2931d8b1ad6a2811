#pragma once

/// @file minkowski.hpp
/// @brief Minkowski difference support mapping for planar_collision

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"

namespace planar_collision {

/// Support function of A - B for two placed shapes
///
/// Holds references only; the shapes and transforms must outlive it.
template<typename T>
class MinkowskiDifference {
public:
    using Vec = TVec2<T>;

    MinkowskiDifference(const Shape<T>& shape_a, const Transform2D<T>& transform_a,
                        const Shape<T>& shape_b, const Transform2D<T>& transform_b)
        : m_shape_a(shape_a)
        , m_transform_a(transform_a)
        , m_shape_b(shape_b)
        , m_transform_b(transform_b) {}

    /// support_A(d) - support_B(-d)
    [[nodiscard]] Vec support(const Vec& direction) const {
        return m_shape_a.support(direction, m_transform_a) - m_shape_b.support(-direction, m_transform_b);
    }

private:
    const Shape<T>& m_shape_a;
    const Transform2D<T>& m_transform_a;
    const Shape<T>& m_shape_b;
    const Transform2D<T>& m_transform_b;
};

} // namespace planar_collision
