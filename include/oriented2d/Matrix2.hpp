#pragma once

#include <oriented2d/Vec2.hpp>
#include <oriented2d/internal/utils/Methods.hpp>
#include <oriented2d/internal/utils/Serialization.hpp>

#include <cmath>
#include <format>
#include <functional>
#include <optional>
#include <string>

namespace o2d
{

// 2x2 linear transform acting on column vectors:
//   | m11 m12 | |x|
//   | m21 m22 | |y|
// a * b applies b first, then a.
struct Matrix2
{
    float m11 = 1.0f;
    float m12 = 0.0f;
    float m21 = 0.0f;
    float m22 = 1.0f;

    constexpr Matrix2() = default;

    constexpr Matrix2(float m11, float m12, float m21, float m22) : m11(m11), m12(m12), m21(m21), m22(m22) {}

    static constexpr Matrix2 identity()
    {
        return Matrix2{};
    }

    // Counter-clockwise rotation in a Y-up frame (clockwise on a Y-down screen)
    static Matrix2 rotation(float angleRadians)
    {
        const float sin = std::sin(angleRadians);
        const float cos = std::cos(angleRadians);
        return Matrix2{cos, -sin, sin, cos};
    }

    static constexpr Matrix2 scale(float factor)
    {
        return Matrix2{factor, 0.0f, 0.0f, factor};
    }

    static constexpr Matrix2 scale(Vec2 factors)
    {
        return Matrix2{factors.x, 0.0f, 0.0f, factors.y};
    }

    constexpr Vec2 apply(Vec2 vec) const
    {
        return Vec2{m11 * vec.x + m12 * vec.y, m21 * vec.x + m22 * vec.y};
    }

    constexpr float determinant() const
    {
        return m11 * m22 - m12 * m21;
    }

    // Empty when the matrix is singular
    constexpr std::optional<Matrix2> inverted() const
    {
        const float det = determinant();
        if (det == 0.0f || !std::isfinite(det))
            return std::nullopt;

        const float invDet = 1.0f / det;
        return Matrix2{m22 * invDet, -m12 * invDet, -m21 * invDet, m11 * invDet};
    }

    constexpr Matrix2 transposed() const
    {
        return Matrix2{m11, m21, m12, m22};
    }

    // Component-wise absolute value, maps half-extents to bounding half-extents
    constexpr Matrix2 abs() const
    {
        return Matrix2{std::abs(m11), std::abs(m12), std::abs(m21), std::abs(m22)};
    }

    constexpr Matrix2 operator*(const Matrix2& other) const
    {
        return Matrix2{m11 * other.m11 + m12 * other.m21,
                       m11 * other.m12 + m12 * other.m22,
                       m21 * other.m11 + m22 * other.m21,
                       m21 * other.m12 + m22 * other.m22};
    }

    constexpr Matrix2& operator*=(const Matrix2& other)
    {
        *this = *this * other;
        return *this;
    }

    constexpr Vec2 operator*(Vec2 vec) const
    {
        return apply(vec);
    }

    constexpr bool nearlyEquals(const Matrix2& other, float epsilon = 1e-6f) const
    {
        return float_equals(m11, other.m11, epsilon) && float_equals(m12, other.m12, epsilon) &&
               float_equals(m21, other.m21, epsilon) && float_equals(m22, other.m22, epsilon);
    }

    constexpr bool operator==(const Matrix2& other) const
    {
        return m11 == other.m11 && m12 == other.m12 && m21 == other.m21 && m22 == other.m22;
    }

    constexpr bool operator!=(const Matrix2& other) const
    {
        return !(*this == other);
    }

    std::string toString() const
    {
        return std::format("Matrix2([{}, {}], [{}, {}])", m11, m12, m21, m22);
    }

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(m11, m12, m21, m22);
    }
#endif
};

static_assert(std::is_trivially_copyable_v<Matrix2>, "Matrix2 must be trivially copyable");

} // namespace o2d

template <>
struct std::hash<o2d::Matrix2>
{
    std::size_t operator()(const o2d::Matrix2& matrix) const noexcept
    {
        std::size_t seed = std::hash<float>{}(matrix.m11);
        o2d::hashCombine(seed, matrix.m12);
        o2d::hashCombine(seed, matrix.m21);
        o2d::hashCombine(seed, matrix.m22);
        return seed;
    }
};

template <>
struct std::formatter<o2d::Matrix2> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(const o2d::Matrix2& matrix, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(matrix.toString(), ctx);
    }
};
