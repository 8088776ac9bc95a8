#include <oriented2d/AABB.hpp>

namespace o2d
{

AABB AABB::fromCenter(Vec2 center, Vec2 halfSize)
{
    return AABB{center - halfSize, center + halfSize};
}

AABB AABB::fromPositionSize(Vec2 position, Vec2 size)
{
    return AABB{position, position + size};
}

AABB AABB::combine(AABB a, AABB b)
{
    return AABB{Vec2::min(a.min, b.min), Vec2::max(a.max, b.max)};
}

Vec2 AABB::position() const
{
    return min;
}

Vec2 AABB::center() const
{
    return (min + max) * 0.5f;
}

Vec2 AABB::size() const
{
    return max - min;
}

Vec2 AABB::halfSize() const
{
    return (max - min) * 0.5f;
}

bool AABB::contains(Vec2 point) const
{
    return point.x >= min.x && point.x <= max.x &&
           point.y >= min.y && point.y <= max.y;
}

bool AABB::contains(AABB other) const
{
    return min.x <= other.min.x && min.y <= other.min.y &&
           max.x >= other.max.x && max.y >= other.max.y;
}

bool AABB::intersects(AABB other) const
{
    return min.x <= other.max.x && max.x >= other.min.x &&
           min.y <= other.max.y && max.y >= other.min.y;
}

void AABB::translate(Vec2 direction)
{
    min += direction;
    max += direction;
}

AABB AABB::translated(Vec2 direction) const
{
    return AABB{min + direction, max + direction};
}

void AABB::expandToInclude(Vec2 point)
{
    min = Vec2::min(min, point);
    max = Vec2::max(max, point);
}

AABB AABB::expandedToInclude(Vec2 point) const
{
    AABB result = *this;
    result.expandToInclude(point);
    return result;
}

AABB AABB::transformed(const Matrix2& matrix) const
{
    const Vec2 newCenter = matrix.apply(center());
    const Vec2 newHalfSize = matrix.abs().apply(halfSize());
    return fromCenter(newCenter, newHalfSize);
}

float AABB::perimeter() const
{
    const float wx = max.x - min.x;
    const float wy = max.y - min.y;
    return 2.0f * (wx + wy);
}

std::string AABB::toString() const
{
    return std::format("AABB(min={}, max={})", min, max);
}

} // namespace o2d
