#pragma once

#include <oriented2d/Matrix2.hpp>
#include <oriented2d/Vec2.hpp>
#include <oriented2d/internal/utils/Serialization.hpp>

#include <format>
#include <string>

namespace o2d
{

// Axis-aligned bounding rectangle. Y grows downwards, so `min` is the top-left corner.
struct AABB
{
    Vec2 min;
    Vec2 max;

    AABB() = default;

    AABB(Vec2 min, Vec2 max) : min{min}, max{max} {}

    static AABB fromCenter(Vec2 center, Vec2 halfSize);
    // x/y/width/height view: position is the top-left corner
    static AABB fromPositionSize(Vec2 position, Vec2 size);

    // Returns the smallest AABB that contains both a and b
    static AABB combine(AABB a, AABB b);

    Vec2 position() const;
    Vec2 center() const;
    Vec2 size() const;
    Vec2 halfSize() const;

    bool contains(Vec2 point) const;
    bool contains(AABB other) const;
    // Closed intervals: boxes sharing an edge intersect
    bool intersects(AABB other) const;

    void translate(Vec2 direction);
    AABB translated(Vec2 direction) const;

    void expandToInclude(Vec2 point);
    AABB expandedToInclude(Vec2 point) const;

    // Center and half extents mapped through the matrix about the origin
    AABB transformed(const Matrix2& matrix) const;

    float perimeter() const;

    std::string toString() const;

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(min, max);
    }
#endif

    bool operator==(const AABB& other) const
    {
        return min == other.min && max == other.max;
    }

    bool operator!=(const AABB& other) const
    {
        return !(*this == other);
    }
};

static_assert(std::is_trivially_copyable_v<AABB>, "AABB must be trivially copyable");

} // namespace o2d

// Specialization for std::formatter to allow formatted output of AABB
template <>
struct std::formatter<o2d::AABB> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(o2d::AABB aabb, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(aabb.toString(), ctx);
    }
};
