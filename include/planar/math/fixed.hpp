#pragma once

/// @file fixed.hpp
/// @brief Deterministic Q31.32 fixed-point scalar for planar_math
///
/// Fix64 stores a signed 64-bit raw value with 32 fractional bits.
/// Addition, subtraction and multiplication saturate at the representable
/// range instead of wrapping. Every operation is integer-only, so results
/// are bit-identical across compilers and platforms.

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string>

namespace planar_math {

class Fix64 {
public:
    static constexpr int k_fractional_bits = 32;
    static constexpr std::int64_t k_one_raw = std::int64_t{1} << k_fractional_bits;
    static constexpr std::int64_t k_max_raw = std::numeric_limits<std::int64_t>::max();
    static constexpr std::int64_t k_min_raw = std::numeric_limits<std::int64_t>::min();
    static constexpr std::int64_t k_pi_raw = 0x3243F6A88;
    static constexpr std::int64_t k_half_pi_raw = 0x1921FB544;
    static constexpr std::int64_t k_two_pi_raw = 0x6487ED511;

    /// Uninitialized, like a built-in arithmetic type
    Fix64() = default;

    /// Integral value
    constexpr explicit Fix64(int value) noexcept
        : m_raw(static_cast<std::int64_t>(value) * k_one_raw) {}

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static constexpr Fix64 from_raw(std::int64_t raw) noexcept {
        Fix64 result;
        result.m_raw = raw;
        return result;
    }

    /// numerator / denominator, rounded to nearest
    [[nodiscard]] static Fix64 from_fraction(int numerator, int denominator);

    [[nodiscard]] static Fix64 from_float(float value) noexcept;
    [[nodiscard]] static Fix64 from_double(double value) noexcept;

    // =========================================================================
    // Constants
    // =========================================================================

    [[nodiscard]] static constexpr Fix64 zero() noexcept { return from_raw(0); }
    [[nodiscard]] static constexpr Fix64 one() noexcept { return from_raw(k_one_raw); }
    [[nodiscard]] static constexpr Fix64 pi() noexcept { return from_raw(k_pi_raw); }
    [[nodiscard]] static constexpr Fix64 half_pi() noexcept { return from_raw(k_half_pi_raw); }
    [[nodiscard]] static constexpr Fix64 two_pi() noexcept { return from_raw(k_two_pi_raw); }
    [[nodiscard]] static constexpr Fix64 max_value() noexcept { return from_raw(k_max_raw); }
    [[nodiscard]] static constexpr Fix64 min_value() noexcept { return from_raw(k_min_raw); }

    // =========================================================================
    // Conversion
    // =========================================================================

    [[nodiscard]] constexpr std::int64_t raw() const noexcept { return m_raw; }
    [[nodiscard]] float to_float() const noexcept;
    [[nodiscard]] double to_double() const noexcept;

    /// Integral part, rounded toward negative infinity
    [[nodiscard]] constexpr std::int64_t to_int() const noexcept { return m_raw >> k_fractional_bits; }

    [[nodiscard]] constexpr bool is_fractional() const noexcept {
        return (m_raw & 0x00000000FFFFFFFF) != 0;
    }

    // =========================================================================
    // Compound Assignment
    // =========================================================================

    Fix64& operator+=(Fix64 other) noexcept;
    Fix64& operator-=(Fix64 other) noexcept;
    Fix64& operator*=(Fix64 other) noexcept;
    Fix64& operator/=(Fix64 other);

private:
    std::int64_t m_raw;
};

// =============================================================================
// Arithmetic (saturating)
// =============================================================================

[[nodiscard]] Fix64 operator+(Fix64 x, Fix64 y) noexcept;
[[nodiscard]] Fix64 operator-(Fix64 x, Fix64 y) noexcept;
[[nodiscard]] Fix64 operator*(Fix64 x, Fix64 y) noexcept;

/// @throws std::domain_error on division by zero
[[nodiscard]] Fix64 operator/(Fix64 x, Fix64 y);

/// Remainder of the raw values (sign follows the dividend)
/// @throws std::domain_error on division by zero
[[nodiscard]] Fix64 operator%(Fix64 x, Fix64 y);

[[nodiscard]] constexpr Fix64 operator-(Fix64 x) noexcept {
    return x.raw() == Fix64::k_min_raw ? Fix64::max_value() : Fix64::from_raw(-x.raw());
}

[[nodiscard]] constexpr Fix64 operator+(Fix64 x) noexcept { return x; }

// =============================================================================
// Comparison
// =============================================================================

[[nodiscard]] constexpr bool operator==(Fix64 x, Fix64 y) noexcept { return x.raw() == y.raw(); }
[[nodiscard]] constexpr bool operator!=(Fix64 x, Fix64 y) noexcept { return x.raw() != y.raw(); }
[[nodiscard]] constexpr bool operator<(Fix64 x, Fix64 y) noexcept { return x.raw() < y.raw(); }
[[nodiscard]] constexpr bool operator>(Fix64 x, Fix64 y) noexcept { return x.raw() > y.raw(); }
[[nodiscard]] constexpr bool operator<=(Fix64 x, Fix64 y) noexcept { return x.raw() <= y.raw(); }
[[nodiscard]] constexpr bool operator>=(Fix64 x, Fix64 y) noexcept { return x.raw() >= y.raw(); }

// =============================================================================
// Math Functions
// =============================================================================

namespace fixed {

/// -1, 0 or 1
[[nodiscard]] constexpr int sign(Fix64 value) noexcept {
    return value.raw() < 0 ? -1 : (value.raw() > 0 ? 1 : 0);
}

/// Absolute value; min_value() saturates to max_value()
[[nodiscard]] Fix64 abs(Fix64 value) noexcept;

[[nodiscard]] Fix64 floor(Fix64 value) noexcept;
[[nodiscard]] Fix64 ceil(Fix64 value) noexcept;

/// Round to nearest, ties to even
[[nodiscard]] Fix64 round(Fix64 value) noexcept;

/// Fractional bits only
[[nodiscard]] Fix64 fractional(Fix64 value) noexcept;

[[nodiscard]] constexpr Fix64 min(Fix64 x, Fix64 y) noexcept { return x < y ? x : y; }
[[nodiscard]] constexpr Fix64 max(Fix64 x, Fix64 y) noexcept { return x > y ? x : y; }

[[nodiscard]] constexpr Fix64 clamp(Fix64 value, Fix64 lo, Fix64 hi) noexcept {
    return value < lo ? lo : (value > hi ? hi : value);
}

[[nodiscard]] Fix64 lerp(Fix64 a, Fix64 b, Fix64 amount) noexcept;

/// Digit-by-digit integer square root
/// @throws std::domain_error for negative input
[[nodiscard]] Fix64 sqrt(Fix64 value);

/// Sine of an angle in radians
[[nodiscard]] Fix64 sin(Fix64 angle) noexcept;

/// Cosine of an angle in radians
[[nodiscard]] Fix64 cos(Fix64 angle) noexcept;

} // namespace fixed

// =============================================================================
// Formatting
// =============================================================================

/// Decimal representation with up to 10 fractional digits
[[nodiscard]] std::string to_string(Fix64 value);

std::ostream& operator<<(std::ostream& os, Fix64 value);

} // namespace planar_math

// =============================================================================
// std::numeric_limits
// =============================================================================

namespace std {

template<>
struct numeric_limits<planar_math::Fix64> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_signed = true;
    static constexpr bool is_integer = false;
    static constexpr bool is_exact = true;
    static constexpr bool has_infinity = false;
    static constexpr bool has_quiet_NaN = false;
    static constexpr bool has_signaling_NaN = false;
    static constexpr bool is_iec559 = false;
    static constexpr bool is_bounded = true;
    static constexpr bool is_modulo = false;
    static constexpr int digits = 63;
    static constexpr int radix = 2;

    static constexpr planar_math::Fix64 min() noexcept { return planar_math::Fix64::from_raw(1); }
    static constexpr planar_math::Fix64 lowest() noexcept { return planar_math::Fix64::min_value(); }
    static constexpr planar_math::Fix64 max() noexcept { return planar_math::Fix64::max_value(); }
    static constexpr planar_math::Fix64 epsilon() noexcept { return planar_math::Fix64::from_raw(1); }
};

} // namespace std
