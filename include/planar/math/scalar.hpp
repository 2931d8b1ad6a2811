#pragma once

/// @file scalar.hpp
/// @brief Numeric traits shared by the float and fixed-point geometry
///
/// Every geometry template in planar is written against ScalarTraits<T>
/// rather than <cmath>, so the same source serves both the IEEE-754 and the
/// deterministic Fix64 instantiations.

#include "fwd.hpp"
#include "constants.hpp"
#include "fixed.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace planar_math {

// =============================================================================
// float
// =============================================================================

template<>
struct ScalarTraits<float> {
    using value_type = float;

    [[nodiscard]] static constexpr float zero() noexcept { return 0.0f; }
    [[nodiscard]] static constexpr float one() noexcept { return 1.0f; }
    [[nodiscard]] static constexpr float from_int(int value) noexcept { return static_cast<float>(value); }
    [[nodiscard]] static constexpr float from_fraction(int numerator, int denominator) noexcept {
        return static_cast<float>(numerator) / static_cast<float>(denominator);
    }
    [[nodiscard]] static constexpr float from_double(double value) noexcept { return static_cast<float>(value); }
    [[nodiscard]] static constexpr float half_pi() noexcept { return consts::FRAC_PI_2; }
    [[nodiscard]] static constexpr float max_value() noexcept { return std::numeric_limits<float>::max(); }
    [[nodiscard]] static constexpr float lowest() noexcept { return std::numeric_limits<float>::lowest(); }

    [[nodiscard]] static float sqrt(float value) noexcept { return std::sqrt(value); }
    [[nodiscard]] static float abs(float value) noexcept { return std::abs(value); }
    [[nodiscard]] static float floor(float value) noexcept { return std::floor(value); }
    [[nodiscard]] static float sin(float value) noexcept { return std::sin(value); }
    [[nodiscard]] static float cos(float value) noexcept { return std::cos(value); }
    [[nodiscard]] static float remainder(float x, float y) noexcept { return std::fmod(x, y); }
    [[nodiscard]] static constexpr float min(float a, float b) noexcept { return std::min(a, b); }
    [[nodiscard]] static constexpr float max(float a, float b) noexcept { return std::max(a, b); }
    [[nodiscard]] static constexpr float clamp(float v, float lo, float hi) noexcept { return std::clamp(v, lo, hi); }
    [[nodiscard]] static constexpr float to_float(float value) noexcept { return value; }
    /// Saturates outside the int64 range; NaN maps to 0
    [[nodiscard]] static std::int64_t floor_to_int(float value) noexcept {
        // Below 2^63, so the cast below is defined
        constexpr float k_limit = 9.2e18f;
        const float floored = std::floor(value);
        if (std::isnan(floored)) {
            return 0;
        }
        if (floored >= k_limit) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (floored <= -k_limit) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(floored);
    }
};

// =============================================================================
// Fix64
// =============================================================================

template<>
struct ScalarTraits<Fix64> {
    using value_type = Fix64;

    [[nodiscard]] static constexpr Fix64 zero() noexcept { return Fix64::zero(); }
    [[nodiscard]] static constexpr Fix64 one() noexcept { return Fix64::one(); }
    [[nodiscard]] static constexpr Fix64 from_int(int value) noexcept { return Fix64(value); }
    [[nodiscard]] static Fix64 from_fraction(int numerator, int denominator) {
        return Fix64::from_fraction(numerator, denominator);
    }
    [[nodiscard]] static Fix64 from_double(double value) noexcept { return Fix64::from_double(value); }
    [[nodiscard]] static constexpr Fix64 half_pi() noexcept { return Fix64::half_pi(); }
    [[nodiscard]] static constexpr Fix64 max_value() noexcept { return Fix64::max_value(); }
    [[nodiscard]] static constexpr Fix64 lowest() noexcept { return Fix64::min_value(); }

    [[nodiscard]] static Fix64 sqrt(Fix64 value) { return fixed::sqrt(value); }
    [[nodiscard]] static Fix64 abs(Fix64 value) noexcept { return fixed::abs(value); }
    [[nodiscard]] static Fix64 floor(Fix64 value) noexcept { return fixed::floor(value); }
    [[nodiscard]] static Fix64 sin(Fix64 value) noexcept { return fixed::sin(value); }
    [[nodiscard]] static Fix64 cos(Fix64 value) noexcept { return fixed::cos(value); }
    [[nodiscard]] static Fix64 remainder(Fix64 x, Fix64 y) { return x % y; }
    [[nodiscard]] static constexpr Fix64 min(Fix64 a, Fix64 b) noexcept { return fixed::min(a, b); }
    [[nodiscard]] static constexpr Fix64 max(Fix64 a, Fix64 b) noexcept { return fixed::max(a, b); }
    [[nodiscard]] static constexpr Fix64 clamp(Fix64 v, Fix64 lo, Fix64 hi) noexcept { return fixed::clamp(v, lo, hi); }
    [[nodiscard]] static float to_float(Fix64 value) noexcept { return value.to_float(); }
    [[nodiscard]] static constexpr std::int64_t floor_to_int(Fix64 value) noexcept { return value.to_int(); }
};

} // namespace planar_math
