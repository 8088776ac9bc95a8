#include <oriented2d/OrientedRectangle.hpp>

namespace o2d
{

OrientedRectangle OrientedRectangle::fromAABB(const AABB& aabb)
{
    const Vec2 radii = aabb.size() * 0.5f;
    return OrientedRectangle{aabb.position() + radii, radii, Matrix2::identity()};
}

RectangleCorners OrientedRectangle::points() const
{
    // Y grows downwards: "top" is the negative local Y
    const Vec2 rightTop{radii.x, -radii.y};
    const Vec2 leftTop = -radii;
    const Vec2 leftBottom{-radii.x, radii.y};
    const Vec2 rightBottom = radii;

    return RectangleCorners{
        orientation.apply(rightTop) + center,
        orientation.apply(leftTop) + center,
        orientation.apply(leftBottom) + center,
        orientation.apply(rightBottom) + center,
    };
}

Vec2 OrientedRectangle::position() const
{
    return orientation.apply(-radii) + center;
}

AABB OrientedRectangle::boundingBox() const
{
    const RectangleCorners corners = points();

    AABB box{corners[0], corners[0]};
    for (std::size_t i = 1; i < corners.size(); ++i)
        box.expandToInclude(corners[i]);

    return box;
}

AABB OrientedRectangle::toAABB() const
{
    return boundingBox();
}

bool OrientedRectangle::isDegenerate() const
{
    return radii.x == 0.0f || radii.y == 0.0f;
}

OrientedRectangle OrientedRectangle::transformed(const Matrix2& matrix) const
{
    OrientedRectangle result = *this;
    result.center = matrix.apply(result.center);
    result.orientation = matrix * result.orientation;
    return result;
}

OrientedRectangle transform(const OrientedRectangle& rectangle, const Matrix2& matrix)
{
    return rectangle.transformed(matrix);
}

std::string OrientedRectangle::toString() const
{
    return std::format("OrientedRectangle(center={}, radii={}, orientation={})", center, radii, orientation);
}

void OrientedRectangle::serialize(std::ostream& out) const
{
    Writer writer(out);

    writer(center.x);
    writer(center.y);
    writer(radii.x);
    writer(radii.y);
    writer(orientation.m11);
    writer(orientation.m12);
    writer(orientation.m21);
    writer(orientation.m22);
}

OrientedRectangle OrientedRectangle::deserialize(std::istream& in)
{
    Reader reader(in);
    OrientedRectangle rectangle;

    reader(rectangle.center.x);
    reader(rectangle.center.y);
    reader(rectangle.radii.x);
    reader(rectangle.radii.y);
    reader(rectangle.orientation.m11);
    reader(rectangle.orientation.m12);
    reader(rectangle.orientation.m21);
    reader(rectangle.orientation.m22);

    O2D_DEBUG_ASSERT(reader.good(), "Truncated OrientedRectangle data");
    return rectangle;
}

} // namespace o2d
