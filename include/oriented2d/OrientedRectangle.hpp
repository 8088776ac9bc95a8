#pragma once

#include <oriented2d/AABB.hpp>
#include <oriented2d/Matrix2.hpp>
#include <oriented2d/Vec2.hpp>
#include <oriented2d/internal/utils/Debug.hpp>
#include <oriented2d/internal/utils/Methods.hpp>
#include <oriented2d/internal/utils/Serialization.hpp>

#include <array>
#include <format>
#include <functional>
#include <istream>
#include <ostream>
#include <string>

namespace o2d
{

// Corners in the order right-top, left-top, left-bottom, right-bottom of the local frame
using RectangleCorners = std::array<Vec2, 4>;

// Oriented bounding rectangle (Ericson, Real-Time Collision Detection, 4.4).
// `orientation` is expected to be a pure rotation: shear or non-uniform scale
// invalidates the overlap test.
struct OrientedRectangle
{
    Vec2 center{};                     // World-space centroid
    Vec2 radii{};                      // Half extents along the local axes, must be >= 0
    Matrix2 orientation{};             // Local offsets -> world directions

    constexpr OrientedRectangle() = default;

    OrientedRectangle(Vec2 center, Vec2 radii, const Matrix2& orientation = Matrix2::identity())
        : center(center), radii(radii), orientation(orientation)
    {
        O2D_DEBUG_ASSERT(radii.x >= 0.0f && radii.y >= 0.0f, "OrientedRectangle radii must be non-negative");
    }

    static OrientedRectangle fromAABB(const AABB& aabb);

    RectangleCorners points() const;
    // Left-top corner
    Vec2 position() const;
    AABB boundingBox() const;
    // Enclosing box; discards the rotation
    AABB toAABB() const;

    // True when the rectangle collapses to a segment or a point
    bool isDegenerate() const;

    // Maps center and orientation through `matrix` about the origin. Radii are kept
    // as they are, so only rotation matrices give a geometrically exact result.
    OrientedRectangle transformed(const Matrix2& matrix) const;

    std::string toString() const;

    void serialize(std::ostream& out) const;
    static OrientedRectangle deserialize(std::istream& in);

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(center, radii, orientation);
    }
#endif

    // Exact comparison of every field, no tolerance
    bool operator==(const OrientedRectangle& other) const
    {
        return center == other.center && radii == other.radii && orientation == other.orientation;
    }

    bool operator!=(const OrientedRectangle& other) const
    {
        return !(*this == other);
    }
};

static_assert(std::is_trivially_copyable_v<OrientedRectangle>, "OrientedRectangle must be trivially copyable");

OrientedRectangle transform(const OrientedRectangle& rectangle, const Matrix2& matrix);

// Separating axis test on the edges of both rectangles. Touching counts as intersecting.
bool intersects(const OrientedRectangle& rectangleA, const OrientedRectangle& rectangleB);
bool intersects(const OrientedRectangle& rectangle, const AABB& aabb);
bool intersects(const AABB& aabb, const OrientedRectangle& rectangle);

} // namespace o2d

template <>
struct std::hash<o2d::OrientedRectangle>
{
    std::size_t operator()(const o2d::OrientedRectangle& rectangle) const noexcept
    {
        std::size_t seed = std::hash<o2d::Vec2>{}(rectangle.center);
        o2d::hashCombine(seed, rectangle.radii);
        o2d::hashCombine(seed, rectangle.orientation);
        return seed;
    }
};

template <>
struct std::formatter<o2d::OrientedRectangle> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(const o2d::OrientedRectangle& rectangle, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(rectangle.toString(), ctx);
    }
};
