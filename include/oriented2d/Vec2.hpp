#pragma once

#include <oriented2d/internal/utils/Methods.hpp>
#include <oriented2d/internal/utils/Serialization.hpp>

#include <cmath>
#include <format>
#include <functional>
#include <string>

namespace o2d
{

class Vec2
{
  public:
    float x;
    float y;

    constexpr Vec2() : Vec2(0, 0) {}

    constexpr Vec2(float x, float y) : x(x), y(y) {}

    constexpr Vec2(const Vec2& other) = default;
    constexpr Vec2& operator=(const Vec2& other) = default;
    constexpr Vec2(Vec2&& other) noexcept = default;
    constexpr Vec2& operator=(Vec2&& other) noexcept = default;

    static constexpr Vec2 unitX()
    {
        return Vec2(1, 0);
    }

    static constexpr Vec2 unitY()
    {
        return Vec2(0, 1);
    }

    std::string toString() const;

    constexpr float length() const;
    constexpr float lengthSqr() const;

    constexpr float dot(Vec2 other) const;

    constexpr Vec2 normalize() const;
    // Counter-clockwise perpendicular (x, y) -> (-y, x)
    constexpr Vec2 perpendicular() const;

    static constexpr Vec2 min(Vec2 a, Vec2 b);
    static constexpr Vec2 max(Vec2 a, Vec2 b);

    constexpr Vec2 abs() const;

    // Tolerant comparison, operator== is exact
    constexpr bool nearlyEquals(Vec2 other, float epsilon = 1e-6f) const;

    constexpr Vec2& operator+=(Vec2 other);
    constexpr Vec2& operator-=(Vec2 other);
    constexpr Vec2& operator*=(Vec2 other);
    constexpr Vec2& operator/=(Vec2 other);
    constexpr Vec2& operator*=(float value);
    constexpr Vec2& operator/=(float value);

    constexpr Vec2 operator+(Vec2 other) const;
    constexpr Vec2 operator-(Vec2 other) const;
    constexpr Vec2 operator*(Vec2 other) const;
    constexpr Vec2 operator/(Vec2 other) const;
    constexpr Vec2 operator*(float value) const;
    constexpr Vec2 operator/(float value) const;
    constexpr friend Vec2 operator*(float value, Vec2 vec);

    constexpr Vec2 operator-() const;

    constexpr bool operator==(Vec2 other) const;
    constexpr bool operator!=(Vec2 other) const;

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(x, y);
    }
#endif
};

inline std::string Vec2::toString() const
{
    return std::format("Vec2({}, {})", x, y);
}

constexpr float Vec2::length() const
{
    return std::sqrt(x * x + y * y);
}

constexpr float Vec2::lengthSqr() const
{
    return x * x + y * y;
}

constexpr float Vec2::dot(Vec2 other) const
{
    return x * other.x + y * other.y;
}

constexpr Vec2 Vec2::normalize() const
{
    const float multiplier = 1.0f / length();
    return Vec2(x * multiplier, y * multiplier);
}

constexpr Vec2 Vec2::perpendicular() const
{
    return Vec2(-y, x);
}

constexpr Vec2 Vec2::min(Vec2 a, Vec2 b)
{
    return Vec2(a.x < b.x ? a.x : b.x, a.y < b.y ? a.y : b.y);
}

constexpr Vec2 Vec2::max(Vec2 a, Vec2 b)
{
    return Vec2(a.x > b.x ? a.x : b.x, a.y > b.y ? a.y : b.y);
}

constexpr Vec2 Vec2::abs() const
{
    return Vec2(std::abs(x), std::abs(y));
}

constexpr bool Vec2::nearlyEquals(Vec2 other, float epsilon) const
{
    return float_equals(x, other.x, epsilon) && float_equals(y, other.y, epsilon);
}

// Arithmetic compound assignment
constexpr Vec2& Vec2::operator+=(Vec2 other)
{
    x += other.x;
    y += other.y;
    return *this;
}

constexpr Vec2& Vec2::operator-=(Vec2 other)
{
    x -= other.x;
    y -= other.y;
    return *this;
}

constexpr Vec2& Vec2::operator*=(Vec2 other)
{
    x *= other.x;
    y *= other.y;
    return *this;
}

constexpr Vec2& Vec2::operator/=(Vec2 other)
{
    x /= other.x;
    y /= other.y;
    return *this;
}

// Scalar compound assignment
constexpr Vec2& Vec2::operator*=(float value)
{
    x *= value;
    y *= value;
    return *this;
}

constexpr Vec2& Vec2::operator/=(float value)
{
    x /= value;
    y /= value;
    return *this;
}

constexpr Vec2 Vec2::operator+(Vec2 other) const
{
    Vec2 result = *this;
    result += other;
    return result;
}

constexpr Vec2 Vec2::operator-(Vec2 other) const
{
    Vec2 result = *this;
    result -= other;
    return result;
}

constexpr Vec2 Vec2::operator*(Vec2 other) const
{
    Vec2 result = *this;
    result *= other;
    return result;
}

constexpr Vec2 Vec2::operator/(Vec2 other) const
{
    Vec2 result = *this;
    result /= other;
    return result;
}

constexpr Vec2 Vec2::operator*(float value) const
{
    Vec2 result = *this;
    result *= value;
    return result;
}

constexpr Vec2 Vec2::operator/(float value) const
{
    Vec2 result = *this;
    result /= value;
    return result;
}

constexpr Vec2 operator*(float value, Vec2 vec)
{
    return Vec2(vec.x * value, vec.y * value);
}

constexpr Vec2 Vec2::operator-() const
{
    return Vec2(-x, -y);
}

constexpr bool Vec2::operator==(Vec2 other) const
{
    return x == other.x && y == other.y;
}

constexpr bool Vec2::operator!=(Vec2 other) const
{
    return !(*this == other);
}

static_assert(std::is_trivially_copyable_v<Vec2>, "Vec2 must be trivially copyable");

} // namespace o2d

template <>
struct std::hash<o2d::Vec2>
{
    std::size_t operator()(o2d::Vec2 vec) const noexcept
    {
        std::size_t seed = std::hash<float>{}(vec.x);
        o2d::hashCombine(seed, vec.y);
        return seed;
    }
};

// Specialization for std::formatter to allow formatted output of Vec2
template <>
struct std::formatter<o2d::Vec2> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(o2d::Vec2 vec, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(vec.toString(), ctx);
    }
};
