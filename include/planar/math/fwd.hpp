#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for planar_math types

// Fix64 instantiates GLM vectors, so GLM must not restrict itself to IEEE scalars
#ifndef GLM_FORCE_UNRESTRICTED_GENTYPE
#define GLM_FORCE_UNRESTRICTED_GENTYPE
#endif
#ifndef GLM_FORCE_RADIANS
#define GLM_FORCE_RADIANS
#endif

#include <glm/fwd.hpp>

namespace planar_math {

// =============================================================================
// Scalars
// =============================================================================

class Fix64;

template<typename T>
struct ScalarTraits;

// =============================================================================
// Vector / Matrix Types (GLM aliases)
// =============================================================================

/// 2D vector over any scalar
template<typename T>
using TVec2 = glm::vec<2, T, glm::defaultp>;

/// Affine 2D matrix: columns are x-axis image, y-axis image, translation
template<typename T>
using TMat3x2 = glm::mat<3, 2, T, glm::defaultp>;

using Vec2 = TVec2<float>;

// =============================================================================
// Forward Declarations (planar_math types)
// =============================================================================

template<typename T>
class Transform2D;

} // namespace planar_math
