#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

#include <oriented2d/Constants.hpp>
#include <oriented2d/OrientedRectangle.hpp>

#include "utils/Random.hpp"

using namespace o2d;
using namespace Catch;

namespace
{

OrientedRectangle translatedBy(const OrientedRectangle& rectangle, Vec2 offset)
{
    OrientedRectangle result = rectangle;
    result.center += offset;
    return result;
}

// Bounding boxes apart by more than `gap` on some axis
bool boxesClearlyApart(const AABB& a, const AABB& b, float gap)
{
    return a.max.x + gap < b.min.x || b.max.x + gap < a.min.x || a.max.y + gap < b.min.y || b.max.y + gap < a.min.y;
}

} // namespace

TEST_CASE("intersects axis-aligned rectangles", "[collision][intersects]")
{
    const OrientedRectangle a{Vec2{0.0f, 0.0f}, Vec2{1.0f, 1.0f}};

    SECTION("Overlapping by half a unit")
    {
        const OrientedRectangle b{Vec2{1.5f, 0.0f}, Vec2{1.0f, 1.0f}};
        CHECK(intersects(a, b));
    }

    SECTION("Separated")
    {
        const OrientedRectangle c{Vec2{3.0f, 0.0f}, Vec2{1.0f, 1.0f}};
        CHECK_FALSE(intersects(a, c));
    }

    SECTION("Sharing an edge")
    {
        const OrientedRectangle b{Vec2{2.0f, 0.0f}, Vec2{1.0f, 1.0f}};
        CHECK(intersects(a, b));
    }

    SECTION("Sharing a corner")
    {
        const OrientedRectangle b{Vec2{2.0f, -2.0f}, Vec2{1.0f, 1.0f}};
        CHECK(intersects(a, b));
    }

    SECTION("Contained")
    {
        const OrientedRectangle inner{Vec2{0.2f, -0.1f}, Vec2{0.25f, 0.5f}};
        CHECK(intersects(a, inner));
        CHECK(intersects(inner, a));
    }
}

TEST_CASE("intersects rotated rectangles", "[collision][intersects][Rotation]")
{
    const OrientedRectangle a{Vec2{0.0f, 0.0f}, Vec2{1.0f, 1.0f}};
    const Matrix2 eighthTurn = Matrix2::rotation(PI / 4.0f);
    const float halfDiagonal = std::sqrt(2.0f);

    SECTION("Diamond corner reaching into the edge")
    {
        const OrientedRectangle b{Vec2{2.0f, 0.0f}, Vec2{1.0f, 1.0f}, eighthTurn};
        CHECK(intersects(a, b));
        CHECK(intersects(b, a));
    }

    SECTION("Quarter-turned square sharing an edge")
    {
        const Matrix2 quarterTurn{0.0f, -1.0f, 1.0f, 0.0f};
        const OrientedRectangle b{Vec2{2.0f, 0.0f}, Vec2{1.0f, 1.0f}, quarterTurn};
        CHECK(intersects(a, b));
    }

    SECTION("Diamond corner just inside and just outside the edge")
    {
        const OrientedRectangle inside{Vec2{1.0f + halfDiagonal - 1e-3f, 0.0f}, Vec2{1.0f, 1.0f}, eighthTurn};
        const OrientedRectangle outside{Vec2{1.0f + halfDiagonal + 1e-3f, 0.0f}, Vec2{1.0f, 1.0f}, eighthTurn};
        CHECK(intersects(a, inside));
        CHECK_FALSE(intersects(a, outside));
    }

    SECTION("Overlapping bounding boxes but separated shapes")
    {
        // Diamonds facing each other across the diagonal gap
        const OrientedRectangle b{Vec2{0.0f, 0.0f}, Vec2{1.0f, 0.2f}, eighthTurn};
        const OrientedRectangle c{Vec2{1.0f, -1.0f}, Vec2{1.0f, 0.2f}, eighthTurn};
        REQUIRE(b.boundingBox().intersects(c.boundingBox()));
        CHECK_FALSE(intersects(b, c));
        CHECK_FALSE(intersects(c, b));
    }
}

TEST_CASE("intersects against AABBs", "[collision][intersects][AABB]")
{
    const OrientedRectangle diamond{Vec2{0.0f, 0.0f}, Vec2{1.0f, 1.0f}, Matrix2::rotation(PI / 4.0f)};

    // The box sits in the corner region of the diamond's bounding box
    const AABB corner = AABB::fromPositionSize(Vec2{1.0f, 1.0f}, Vec2{1.0f, 1.0f});
    REQUIRE(diamond.boundingBox().intersects(corner));
    CHECK_FALSE(intersects(diamond, corner));
    CHECK_FALSE(intersects(corner, diamond));

    const AABB touching = AABB::fromPositionSize(Vec2{0.5f, 0.5f}, Vec2{1.0f, 1.0f});
    CHECK(intersects(diamond, touching));
    CHECK(intersects(touching, diamond));
}

TEST_CASE("intersects degenerate rectangles", "[collision][intersects][Degenerate]")
{
    const OrientedRectangle segment{Vec2{0.0f, 0.0f}, Vec2{1.0f, 0.0f}};
    const OrientedRectangle point{Vec2{0.5f, 0.5f}, Vec2{0.0f, 0.0f}};
    const OrientedRectangle square{Vec2{0.0f, 0.0f}, Vec2{1.0f, 1.0f}};
    const Matrix2 eighthTurn = Matrix2::rotation(PI / 4.0f);

    SECTION("Segment against a diamond is separated only by the segment normal")
    {
        const OrientedRectangle above{Vec2{0.0f, 0.8f}, Vec2{0.5f, 0.5f}, eighthTurn};
        const OrientedRectangle across{Vec2{0.0f, 0.6f}, Vec2{0.5f, 0.5f}, eighthTurn};

        CHECK_FALSE(intersects(segment, above));
        CHECK_FALSE(intersects(above, segment));
        CHECK(intersects(segment, across));
        CHECK(intersects(across, segment));
    }

    SECTION("Segment along the other local axis")
    {
        const OrientedRectangle vertical{Vec2{3.0f, 0.0f}, Vec2{0.0f, 2.0f}};
        CHECK_FALSE(intersects(vertical, square));
        CHECK(intersects(translatedBy(vertical, Vec2{-2.0f, 0.0f}), square));
    }

    SECTION("Crossing and parallel segments")
    {
        const OrientedRectangle crossing{Vec2{0.0f, 0.0f}, Vec2{1.0f, 0.0f}, Matrix2{0.0f, -1.0f, 1.0f, 0.0f}};
        const OrientedRectangle parallel{Vec2{0.0f, 0.5f}, Vec2{1.0f, 0.0f}};
        CHECK(intersects(segment, crossing));
        CHECK_FALSE(intersects(segment, parallel));
    }

    SECTION("Point inside and outside a rectangle")
    {
        CHECK(intersects(point, square));
        CHECK(intersects(square, point));
        CHECK_FALSE(intersects(translatedBy(point, Vec2{1.0f, 0.0f}), square));
        CHECK_FALSE(intersects(square, translatedBy(point, Vec2{1.0f, 0.0f})));
    }

    SECTION("Points")
    {
        CHECK(intersects(point, point));
        CHECK_FALSE(intersects(point, translatedBy(point, Vec2{0.0f, 0.25f})));
    }
}

TEST_CASE("intersects is symmetric and reflexive", "[collision][intersects][Properties]")
{
    const auto rectangles = generateRandomRectangles(120, -10.0f, 10.0f, 3.0f, 7);

    for (const auto& a : rectangles)
    {
        CHECK(intersects(a, a));
        for (const auto& b : rectangles)
            CHECK(intersects(a, b) == intersects(b, a));
    }
}

TEST_CASE("intersects is unchanged by a shared translation", "[collision][intersects][Properties]")
{
    const auto rectangles = generateRandomRectangles(80, -10.0f, 10.0f, 3.0f, 11);
    const std::vector<Vec2> offsets = {Vec2{16.0f, 0.0f}, Vec2{-8.0f, 32.0f}, Vec2{0.5f, -0.25f}};
    const std::vector<Vec2> nudges = {Vec2{1e-2f, 0.0f}, Vec2{-1e-2f, 0.0f}, Vec2{0.0f, 1e-2f}, Vec2{0.0f, -1e-2f}};

    for (std::size_t i = 0; i < rectangles.size(); ++i)
    {
        for (std::size_t j = i + 1; j < rectangles.size(); ++j)
        {
            const auto& a = rectangles[i];
            const auto& b = rectangles[j];
            const bool expected = intersects(a, b);

            // Pairs in near contact are left out: rounding of the shifted corners may flip them
            bool nearContact = false;
            for (const Vec2 nudge : nudges)
                nearContact = nearContact || intersects(translatedBy(a, nudge), b) != expected;
            if (nearContact)
                continue;

            for (const Vec2 offset : offsets)
                CHECK(intersects(translatedBy(a, offset), translatedBy(b, offset)) == expected);
        }
    }
}

TEST_CASE("intersects never reports rectangles with disjoint bounding boxes", "[collision][intersects][Properties]")
{
    const auto rectangles = generateRandomRectangles(150, -20.0f, 20.0f, 2.5f, 3);

    std::size_t checked = 0;
    for (const auto& a : rectangles)
    {
        for (const auto& b : rectangles)
        {
            if (!boxesClearlyApart(a.boundingBox(), b.boundingBox(), 1e-3f))
                continue;
            ++checked;
            CHECK_FALSE(intersects(a, b));
        }
    }
    CHECK(checked > 0);
}
