#pragma once

/// @file constants.hpp
/// @brief Angle constants for the float scalar
///
/// Fix64 carries its own exact raw patterns (Fix64::pi() and friends);
/// these match them to float precision.

namespace planar_math {

namespace consts {

inline constexpr float PI = 3.14159265358979323846f;
inline constexpr float FRAC_PI_2 = 0.5f * PI;

} // namespace consts

} // namespace planar_math
