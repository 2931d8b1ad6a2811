/// @file fixed.cpp
/// @brief Fix64 arithmetic and elementary functions

#include <planar/math/fixed.hpp>

#include <bit>
#include <cstdio>
#include <ostream>
#include <stdexcept>

namespace planar_math {

namespace {

constexpr int k_num_bits = 64;
constexpr std::uint64_t k_low_mask = 0x00000000FFFFFFFF;

/// (2^29) * PI, the largest power-of-two multiple of PI below max_value()
constexpr std::int64_t k_large_pi_raw = 7244019458077122842;

/// Two's complement addition without signed overflow
constexpr std::int64_t wrapping_add(std::int64_t x, std::int64_t y) noexcept {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(x) + static_cast<std::uint64_t>(y));
}

constexpr std::int64_t wrapping_sub(std::int64_t x, std::int64_t y) noexcept {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(x) - static_cast<std::uint64_t>(y));
}

std::int64_t add_tracking_carry(std::int64_t x, std::int64_t y, bool& overflow) noexcept {
    const std::int64_t sum = wrapping_add(x, y);
    overflow |= ((x ^ y ^ sum) & Fix64::k_min_raw) != 0;
    return sum;
}

constexpr std::uint64_t magnitude(std::int64_t value) noexcept {
    return value >= 0 ? static_cast<std::uint64_t>(value) : std::uint64_t{0} - static_cast<std::uint64_t>(value);
}

/// Reduce an angle to [0, PI/2) and report the mirroring needed to recover sin(angle)
std::int64_t reduce_angle(std::int64_t angle, bool& flip_horizontal, bool& flip_vertical) noexcept {
    // Successive remainders by 2^n * PI keep far more precision than a single % 2PI
    std::int64_t clamped_two_pi = angle;
    for (int i = 0; i < 29; ++i) {
        clamped_two_pi %= (k_large_pi_raw >> i);
    }
    if (angle < 0) {
        clamped_two_pi += Fix64::k_two_pi_raw;
    }

    flip_vertical = clamped_two_pi >= Fix64::k_pi_raw;

    std::int64_t clamped_pi = clamped_two_pi;
    while (clamped_pi >= Fix64::k_pi_raw) {
        clamped_pi -= Fix64::k_pi_raw;
    }

    flip_horizontal = clamped_pi >= Fix64::k_half_pi_raw;

    std::int64_t clamped_half_pi = clamped_pi;
    if (clamped_half_pi >= Fix64::k_half_pi_raw) {
        clamped_half_pi -= Fix64::k_half_pi_raw;
    }
    return clamped_half_pi;
}

/// sin(x) for x in [0, PI/2] as a nested Taylor series through x^13
Fix64 sin_first_quadrant(Fix64 x) {
    static constexpr int k_denominators[] = {156, 110, 72, 42, 20, 6};

    const Fix64 x2 = x * x;
    Fix64 acc = Fix64::one();
    for (int d : k_denominators) {
        acc = Fix64::one() - x2 * acc / Fix64(d);
    }
    return x * acc;
}

} // anonymous namespace

// =============================================================================
// Factories and Conversion
// =============================================================================

Fix64 Fix64::from_fraction(int numerator, int denominator) {
    return Fix64(numerator) / Fix64(denominator);
}

Fix64 Fix64::from_float(float value) noexcept {
    return from_raw(static_cast<std::int64_t>(static_cast<double>(value) * static_cast<double>(k_one_raw)));
}

Fix64 Fix64::from_double(double value) noexcept {
    return from_raw(static_cast<std::int64_t>(value * static_cast<double>(k_one_raw)));
}

float Fix64::to_float() const noexcept {
    return static_cast<float>(static_cast<double>(m_raw) / static_cast<double>(k_one_raw));
}

double Fix64::to_double() const noexcept {
    return static_cast<double>(m_raw) / static_cast<double>(k_one_raw);
}

Fix64& Fix64::operator+=(Fix64 other) noexcept { return *this = *this + other; }
Fix64& Fix64::operator-=(Fix64 other) noexcept { return *this = *this - other; }
Fix64& Fix64::operator*=(Fix64 other) noexcept { return *this = *this * other; }
Fix64& Fix64::operator/=(Fix64 other) { return *this = *this / other; }

// =============================================================================
// Arithmetic
// =============================================================================

Fix64 operator+(Fix64 x, Fix64 y) noexcept {
    const std::int64_t xl = x.raw();
    const std::int64_t yl = y.raw();
    std::int64_t sum = wrapping_add(xl, yl);
    // Operand signs equal but sum sign differs
    if (((~(xl ^ yl) & (xl ^ sum)) & Fix64::k_min_raw) != 0) {
        sum = xl > 0 ? Fix64::k_max_raw : Fix64::k_min_raw;
    }
    return Fix64::from_raw(sum);
}

Fix64 operator-(Fix64 x, Fix64 y) noexcept {
    const std::int64_t xl = x.raw();
    const std::int64_t yl = y.raw();
    std::int64_t diff = wrapping_sub(xl, yl);
    // Operand signs differ and result sign differs from x
    if ((((xl ^ yl) & (xl ^ diff)) & Fix64::k_min_raw) != 0) {
        diff = xl < 0 ? Fix64::k_min_raw : Fix64::k_max_raw;
    }
    return Fix64::from_raw(diff);
}

Fix64 operator*(Fix64 x, Fix64 y) noexcept {
    const std::int64_t xl = x.raw();
    const std::int64_t yl = y.raw();

    const std::uint64_t xlo = static_cast<std::uint64_t>(xl) & k_low_mask;
    const std::int64_t xhi = xl >> Fix64::k_fractional_bits;
    const std::uint64_t ylo = static_cast<std::uint64_t>(yl) & k_low_mask;
    const std::int64_t yhi = yl >> Fix64::k_fractional_bits;

    const std::uint64_t lolo = xlo * ylo;
    const std::int64_t lohi = static_cast<std::int64_t>(xlo) * yhi;
    const std::int64_t hilo = xhi * static_cast<std::int64_t>(ylo);
    const std::int64_t hihi = xhi * yhi;

    const auto lo_result = static_cast<std::int64_t>(lolo >> Fix64::k_fractional_bits);
    const auto hi_result = static_cast<std::int64_t>(static_cast<std::uint64_t>(hihi) << Fix64::k_fractional_bits);

    bool overflow = false;
    std::int64_t sum = add_tracking_carry(lo_result, lohi, overflow);
    sum = add_tracking_carry(sum, hilo, overflow);
    sum = add_tracking_carry(sum, hi_result, overflow);

    const bool op_signs_equal = ((xl ^ yl) & Fix64::k_min_raw) == 0;

    // Equal signs with a negative result overflowed positively, and vice versa
    if (op_signs_equal) {
        if (sum < 0 || (overflow && xl > 0)) {
            return Fix64::max_value();
        }
    } else {
        if (sum > 0) {
            return Fix64::min_value();
        }
    }

    // Bits of hihi above the result must be pure sign extension
    const std::int64_t top_carry = hihi >> Fix64::k_fractional_bits;
    if (top_carry != 0 && top_carry != -1) {
        return op_signs_equal ? Fix64::max_value() : Fix64::min_value();
    }

    if (!op_signs_equal) {
        const std::int64_t pos_op = xl > yl ? xl : yl;
        const std::int64_t neg_op = xl > yl ? yl : xl;
        if (sum > neg_op && neg_op < -Fix64::k_one_raw && pos_op > Fix64::k_one_raw) {
            return Fix64::min_value();
        }
    }

    return Fix64::from_raw(sum);
}

Fix64 operator/(Fix64 x, Fix64 y) {
    const std::int64_t xl = x.raw();
    const std::int64_t yl = y.raw();

    if (yl == 0) {
        throw std::domain_error("Fix64 division by zero");
    }

    std::uint64_t remainder = magnitude(xl);
    std::uint64_t divider = magnitude(yl);
    std::uint64_t quotient = 0;
    int bit_pos = k_num_bits / 2 + 1;

    // Strip shared powers of two from the divider
    while ((divider & 0xF) == 0 && bit_pos >= 4) {
        divider >>= 4;
        bit_pos -= 4;
    }

    while (remainder != 0 && bit_pos >= 0) {
        int shift = std::countl_zero(remainder);
        if (shift > bit_pos) {
            shift = bit_pos;
        }
        remainder <<= shift;
        bit_pos -= shift;

        const std::uint64_t div = remainder / divider;
        remainder = remainder % divider;
        quotient += div << bit_pos;

        if ((div & ~(~std::uint64_t{0} >> bit_pos)) != 0) {
            return ((xl ^ yl) & Fix64::k_min_raw) == 0 ? Fix64::max_value() : Fix64::min_value();
        }

        remainder <<= 1;
        --bit_pos;
    }

    // Round half away from zero
    ++quotient;
    auto result = static_cast<std::int64_t>(quotient >> 1);
    if (((xl ^ yl) & Fix64::k_min_raw) != 0) {
        result = -result;
    }

    return Fix64::from_raw(result);
}

Fix64 operator%(Fix64 x, Fix64 y) {
    if (y.raw() == 0) {
        throw std::domain_error("Fix64 remainder by zero");
    }
    if (x.raw() == Fix64::k_min_raw && y.raw() == -1) {
        return Fix64::zero();
    }
    return Fix64::from_raw(x.raw() % y.raw());
}

// =============================================================================
// Math Functions
// =============================================================================

namespace fixed {

Fix64 abs(Fix64 value) noexcept {
    if (value.raw() == Fix64::k_min_raw) {
        return Fix64::max_value();
    }
    const std::int64_t mask = value.raw() >> 63;
    return Fix64::from_raw((value.raw() + mask) ^ mask);
}

Fix64 floor(Fix64 value) noexcept {
    return Fix64::from_raw(static_cast<std::int64_t>(static_cast<std::uint64_t>(value.raw()) & ~k_low_mask));
}

Fix64 ceil(Fix64 value) noexcept {
    return value.is_fractional() ? floor(value) + Fix64::one() : value;
}

Fix64 round(Fix64 value) noexcept {
    const std::uint64_t fractional_part = static_cast<std::uint64_t>(value.raw()) & k_low_mask;
    const Fix64 integral_part = floor(value);
    if (fractional_part < 0x80000000) {
        return integral_part;
    }
    if (fractional_part > 0x80000000) {
        return integral_part + Fix64::one();
    }
    return (integral_part.raw() & Fix64::k_one_raw) == 0 ? integral_part : integral_part + Fix64::one();
}

Fix64 fractional(Fix64 value) noexcept {
    return Fix64::from_raw(static_cast<std::int64_t>(static_cast<std::uint64_t>(value.raw()) & k_low_mask));
}

Fix64 lerp(Fix64 a, Fix64 b, Fix64 amount) noexcept {
    return a + (b - a) * amount;
}

Fix64 sqrt(Fix64 value) {
    const std::int64_t xl = value.raw();
    if (xl < 0) {
        throw std::domain_error("Fix64 square root of a negative value");
    }

    auto num = static_cast<std::uint64_t>(xl);
    std::uint64_t result = 0;

    // Second-to-top bit
    std::uint64_t bit = std::uint64_t{1} << (k_num_bits - 2);
    while (bit > num) {
        bit >>= 2;
    }

    // Two passes avoid 128-bit intermediates: top 48 bits first, then the low 16
    for (int i = 0; i < 2; ++i) {
        while (bit != 0) {
            if (num >= result + bit) {
                num -= result + bit;
                result = (result >> 1) + bit;
            } else {
                result = result >> 1;
            }
            bit >>= 2;
        }

        if (i == 0) {
            if (num > (std::uint64_t{1} << (k_num_bits / 2)) - 1) {
                // num = a - (result + 0.5)^2 = num - result - 0.5
                num -= result;
                num = (num << (k_num_bits / 2)) - 0x80000000ULL;
                result = (result << (k_num_bits / 2)) + 0x80000000ULL;
            } else {
                num <<= (k_num_bits / 2);
                result <<= (k_num_bits / 2);
            }
            bit = std::uint64_t{1} << (k_num_bits / 2 - 2);
        }
    }

    if (num > result) {
        ++result;
    }
    return Fix64::from_raw(static_cast<std::int64_t>(result));
}

Fix64 sin(Fix64 angle) noexcept {
    bool flip_horizontal = false;
    bool flip_vertical = false;
    const std::int64_t clamped = reduce_angle(angle.raw(), flip_horizontal, flip_vertical);

    Fix64 value;
    if (clamped == 0) {
        // Quadrant boundaries are exact
        value = flip_horizontal ? Fix64::one() : Fix64::zero();
    } else {
        const Fix64 x = flip_horizontal
            ? Fix64::from_raw(Fix64::k_half_pi_raw - clamped)
            : Fix64::from_raw(clamped);
        value = sin_first_quadrant(x);
    }

    return flip_vertical ? -value : value;
}

Fix64 cos(Fix64 angle) noexcept {
    // cos(x) = sin(x + PI/2); shifting positive angles back by 3PI/2 cannot overflow
    const std::int64_t xl = angle.raw();
    const std::int64_t shifted = xl > 0
        ? xl - Fix64::k_pi_raw - Fix64::k_half_pi_raw
        : xl + Fix64::k_half_pi_raw;
    return sin(Fix64::from_raw(shifted));
}

} // namespace fixed

// =============================================================================
// Formatting
// =============================================================================

std::string to_string(Fix64 value) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%.10f", value.to_double());
    std::string text(buffer);

    // Trim trailing zeros and a dangling decimal point
    const auto last = text.find_last_not_of('0');
    if (last != std::string::npos) {
        text.erase(text[last] == '.' ? last : last + 1);
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

std::ostream& operator<<(std::ostream& os, Fix64 value) {
    return os << to_string(value);
}

} // namespace planar_math
