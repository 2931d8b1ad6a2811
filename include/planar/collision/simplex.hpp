#pragma once

/// @file simplex.hpp
/// @brief GJK working simplex for planar_collision

#include "fwd.hpp"
#include "types.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace planar_collision {

/// Up to three points: 0-simplex (point), 1-simplex (segment), 2-simplex (triangle)
template<typename T>
class Simplex2D {
public:
    using Vec = TVec2<T>;

    /// Empty simplex (count 0)
    Simplex2D() = default;

    explicit Simplex2D(const Vec& a) : m_points{a, a, a}, m_count(1) {}
    Simplex2D(const Vec& a, const Vec& b) : m_points{a, b, b}, m_count(2) {}
    Simplex2D(const Vec& a, const Vec& b, const Vec& c) : m_points{a, b, c}, m_count(3) {}

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] int count() const noexcept { return m_count; }
    [[nodiscard]] bool empty() const noexcept { return m_count == 0; }
    [[nodiscard]] bool zero_simplex() const noexcept { return m_count == 1; }
    [[nodiscard]] bool one_simplex() const noexcept { return m_count == 2; }
    [[nodiscard]] bool two_simplex() const noexcept { return m_count == 3; }

    [[nodiscard]] const Vec& a() const { return at(0); }
    [[nodiscard]] const Vec& b() const { return at(1); }
    [[nodiscard]] const Vec& c() const { return at(2); }

    /// @throws std::out_of_range if index >= count()
    [[nodiscard]] const Vec& at(int index) const {
        if (index < 0 || index >= m_count) {
            throw std::out_of_range("Simplex2D index out of range");
        }
        return m_points[static_cast<std::size_t>(index)];
    }

    [[nodiscard]] const Vec& operator[](int index) const { return at(index); }

    [[nodiscard]] const Vec* begin() const noexcept { return m_points.data(); }
    [[nodiscard]] const Vec* end() const noexcept { return m_points.data() + m_count; }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert at index, shifting later vertices back; a full simplex drops its last vertex
    ///
    /// index 0: (p, a, b); index 1: (a, p, b); index 2: (a, b, p)
    /// @throws std::out_of_range if index > count() or index > 2
    void insert(const Vec& point, int index) {
        if (index < 0 || index > 2 || index > m_count) {
            throw std::out_of_range("Simplex2D insert index out of range");
        }
        for (int i = 2; i > index; --i) {
            m_points[static_cast<std::size_t>(i)] = m_points[static_cast<std::size_t>(i - 1)];
        }
        m_points[static_cast<std::size_t>(index)] = point;
        m_count = std::min(m_count + 1, 3);
    }

    /// Same vertex set, in any order
    [[nodiscard]] bool operator==(const Simplex2D& other) const {
        if (m_count != other.m_count) {
            return false;
        }
        auto contains = [](const Simplex2D& s, const Vec& p) {
            return std::find(s.begin(), s.end(), p) != s.end();
        };
        return std::all_of(begin(), end(), [&](const Vec& p) { return contains(other, p); }) &&
               std::all_of(other.begin(), other.end(), [&](const Vec& p) { return contains(*this, p); });
    }

    [[nodiscard]] bool operator!=(const Simplex2D& other) const { return !(*this == other); }

private:
    std::array<Vec, 3> m_points{};
    int m_count = 0;
};

extern template class Simplex2D<float>;
extern template class Simplex2D<Fix64>;

} // namespace planar_collision
