#pragma once

/// @file types.hpp
/// @brief Core type definitions for planar_math

#include "fwd.hpp"

#include <glm/glm.hpp>

#include "constants.hpp"
#include "fixed.hpp"
#include "scalar.hpp"

namespace planar_math {

// =============================================================================
// Vector Constants
// =============================================================================

/// Common vectors for any scalar type
template<typename T>
struct vec2_consts {
    [[nodiscard]] static TVec2<T> zero() { return TVec2<T>(ScalarTraits<T>::zero(), ScalarTraits<T>::zero()); }
    [[nodiscard]] static TVec2<T> one() { return TVec2<T>(ScalarTraits<T>::one(), ScalarTraits<T>::one()); }
    [[nodiscard]] static TVec2<T> unit_x() { return TVec2<T>(ScalarTraits<T>::one(), ScalarTraits<T>::zero()); }
    [[nodiscard]] static TVec2<T> unit_y() { return TVec2<T>(ScalarTraits<T>::zero(), ScalarTraits<T>::one()); }
};

} // namespace planar_math
