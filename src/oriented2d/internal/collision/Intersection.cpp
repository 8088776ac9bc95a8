#include <oriented2d/OrientedRectangle.hpp>

#include <algorithm>
#include <limits>

// 2D OBB overlap after https://www.flipcode.com/archives/2D_OBB_Intersection.shtml

namespace
{

using namespace o2d;

struct ProjectionAxis
{
    Vec2 direction;
    float origin; // Projection of the first source corner
    float extent; // Width of the source interval on this axis
};

bool isDegenerateEdge(Vec2 edge)
{
    return edge.lengthSqr() < std::numeric_limits<float>::min();
}

// The two edges leaving the first corner are scaled by 1 / |edge|^2, so the source
// projects onto [origin, origin + 1]. A collapsed edge is replaced by the unit normal
// of the other one with a zero-width interval; a point uses the world axes.
std::array<ProjectionAxis, 2> computeAxes(const RectangleCorners& source)
{
    const std::array<Vec2, 2> edges = {source[1] - source[0], source[3] - source[0]};
    const bool degenerate0 = isDegenerateEdge(edges[0]);
    const bool degenerate1 = isDegenerateEdge(edges[1]);

    std::array<ProjectionAxis, 2> axes{};
    if (degenerate0 && degenerate1)
    {
        axes[0] = {Vec2::unitX(), 0.0f, 0.0f};
        axes[1] = {Vec2::unitY(), 0.0f, 0.0f};
    }
    else if (degenerate0)
    {
        axes[0] = {edges[1].perpendicular().normalize(), 0.0f, 0.0f};
        axes[1] = {edges[1] / edges[1].lengthSqr(), 0.0f, 1.0f};
    }
    else if (degenerate1)
    {
        axes[0] = {edges[0] / edges[0].lengthSqr(), 0.0f, 1.0f};
        axes[1] = {edges[0].perpendicular().normalize(), 0.0f, 0.0f};
    }
    else
    {
        axes[0] = {edges[0] / edges[0].lengthSqr(), 0.0f, 1.0f};
        axes[1] = {edges[1] / edges[1].lengthSqr(), 0.0f, 1.0f};
    }

    for (auto& axis : axes)
        axis.origin = source[0].dot(axis.direction);

    return axes;
}

// True when no edge of `source` separates it from `target`
bool intersectsOneWay(const RectangleCorners& source, const RectangleCorners& target)
{
    for (const ProjectionAxis& axis : computeAxes(source))
    {
        float tMin = target[0].dot(axis.direction);
        float tMax = tMin;
        for (std::size_t c = 1; c < target.size(); ++c)
        {
            const float t = target[c].dot(axis.direction);
            tMin = std::min(tMin, t);
            tMax = std::max(tMax, t);
        }

        if (tMin > axis.origin + axis.extent || tMax < axis.origin)
            return false;
    }

    return true;
}

} // namespace

namespace o2d
{

bool intersects(const OrientedRectangle& rectangleA, const OrientedRectangle& rectangleB)
{
    const RectangleCorners cornersA = rectangleA.points();
    const RectangleCorners cornersB = rectangleB.points();
    return intersectsOneWay(cornersA, cornersB) && intersectsOneWay(cornersB, cornersA);
}

bool intersects(const OrientedRectangle& rectangle, const AABB& aabb)
{
    return intersects(rectangle, OrientedRectangle::fromAABB(aabb));
}

bool intersects(const AABB& aabb, const OrientedRectangle& rectangle)
{
    return intersects(OrientedRectangle::fromAABB(aabb), rectangle);
}

} // namespace o2d
