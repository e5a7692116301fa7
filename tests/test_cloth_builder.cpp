#include <gtest/gtest.h>
#include <cloth/cloth_builder.hpp>
#include <cloth/cloth_errors.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace drape;

namespace {

size_t count_family(const ClothBody& body, ConstraintFamily family) {
    size_t n = 0;
    for (const auto& c : body.constraints) {
        if (c.family == family) {
            ++n;
        }
    }
    return n;
}

}  // namespace

class ClothBuilderTest : public ::testing::Test {
protected:
    ClothGeometry geometry;  // 10 x 14, 22 x 26 particles
};

TEST_F(ClothBuilderTest, ConstraintCountsPerFamily) {
    ClothBody body = ClothBuilder::build(geometry);
    const size_t w = 22;
    const size_t h = 26;

    EXPECT_EQ(body.grid.size(), w * h);
    EXPECT_EQ(count_family(body, ConstraintFamily::Structural), (w - 1) * h + w * (h - 1));
    EXPECT_EQ(count_family(body, ConstraintFamily::Shear), 2 * (w - 1) * (h - 1));
    EXPECT_EQ(count_family(body, ConstraintFamily::BendAxis), (w - 2) * h + w * (h - 2));
    EXPECT_EQ(count_family(body, ConstraintFamily::BendDiagonal), 2 * (w - 2) * (h - 2));
    EXPECT_EQ(body.constraints.size(), 4154u);
}

TEST_F(ClothBuilderTest, ParticlesSpanTheRectangle) {
    geometry = ClothGeometry{4.0f, 6.0f, 5, 4};
    ClothBody body = ClothBuilder::build(geometry);

    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 5; ++x) {
            const Particle& p = body.grid.particle(x, y);
            EXPECT_NEAR(p.position.x, 1.0f * x, 1e-5f);
            EXPECT_NEAR(p.position.y, -2.0f * y, 1e-5f);
            EXPECT_FLOAT_EQ(p.position.z, 0.0f);
            EXPECT_EQ(p.old_position, p.position);
            EXPECT_EQ(p.acceleration, vec3::zero());
        }
    }

    // Corners map to the unit texture square
    EXPECT_EQ(body.grid.particle(0, 0).tex_coord, Vec2(0.0f, 0.0f));
    EXPECT_NEAR(body.grid.particle(4, 3).tex_coord.x, 1.0f, 1e-6f);
    EXPECT_NEAR(body.grid.particle(4, 3).tex_coord.y, 1.0f, 1e-6f);
    EXPECT_NEAR(body.grid.particle(2, 1).tex_coord.x, 0.5f, 1e-6f);
    EXPECT_NEAR(body.grid.particle(2, 1).tex_coord.y, 1.0f / 3.0f, 1e-6f);
}

TEST_F(ClothBuilderTest, RestDistancesMatchInitialLayout) {
    ClothBody body = ClothBuilder::build(geometry);
    for (const auto& c : body.constraints) {
        EXPECT_GT(c.rest_distance, 0.0f);
        EXPECT_NEAR(c.error(body.grid), 0.0f, 1e-5f);
    }
}

TEST_F(ClothBuilderTest, NeighbourConstraintOrder) {
    geometry = ClothGeometry{2.0f, 2.0f, 3, 3};
    ClothBody body = ClothBuilder::build(geometry, PinPattern{0, 0});
    const auto& grid = body.grid;
    const auto& c = body.constraints;

    // Quad (0, 0): right, down, diagonal, anti-diagonal
    EXPECT_EQ(c[0].p1, grid.index(0, 0));
    EXPECT_EQ(c[0].p2, grid.index(1, 0));
    EXPECT_EQ(c[1].p1, grid.index(0, 0));
    EXPECT_EQ(c[1].p2, grid.index(0, 1));
    EXPECT_EQ(c[2].p1, grid.index(0, 0));
    EXPECT_EQ(c[2].p2, grid.index(1, 1));
    EXPECT_EQ(c[3].p1, grid.index(1, 0));
    EXPECT_EQ(c[3].p2, grid.index(0, 1));

    // y varies fastest
    EXPECT_EQ(c[4].p1, grid.index(0, 1));
    EXPECT_EQ(c[4].p2, grid.index(1, 1));

    // Bend constraints follow all neighbour constraints
    const size_t neighbour = 2 * 2 * 3 + 2 * 2 * 2;
    ASSERT_GT(c.size(), neighbour);
    EXPECT_EQ(c[neighbour - 1].family, ConstraintFamily::Structural);
    EXPECT_EQ(c[neighbour].family, ConstraintFamily::BendAxis);
    EXPECT_EQ(c[neighbour].p1, grid.index(0, 0));
    EXPECT_EQ(c[neighbour].p2, grid.index(2, 0));
}

TEST_F(ClothBuilderTest, DefaultPinsAreTopCorners) {
    ClothBody body = ClothBuilder::build(geometry);
    for (int x = 0; x < 22; ++x) {
        bool expected_pinned = x < 3 || x >= 19;
        EXPECT_EQ(body.grid.particle(x, 0).movable, !expected_pinned) << "column " << x;
    }
    for (int y = 1; y < 26; ++y) {
        for (int x = 0; x < 22; ++x) {
            EXPECT_TRUE(body.grid.particle(x, y).movable);
        }
    }
    EXPECT_EQ(body.grid.size() - body.grid.movable_count(), 6u);
}

TEST_F(ClothBuilderTest, PinnedParticlesStayOnTheLattice) {
    ClothBody body = ClothBuilder::build(geometry);
    for (int x : {0, 1, 2, 19, 20, 21}) {
        const Particle& p = body.grid.particle(x, 0);
        ASSERT_FALSE(p.movable);
        test::expect_vec3_near(p.position, Vec3(geometry.width * x / 21.0f, 0.0f, 0.0f), 1e-5f);
        EXPECT_EQ(p.old_position, p.position);
    }
}

TEST_F(ClothBuilderTest, PinCountsClampToRowWidth) {
    geometry = ClothGeometry{1.0f, 1.0f, 2, 2};
    ClothBody body = ClothBuilder::build(geometry);
    EXPECT_FALSE(body.grid.particle(0, 0).movable);
    EXPECT_FALSE(body.grid.particle(1, 0).movable);
    EXPECT_TRUE(body.grid.particle(0, 1).movable);
    EXPECT_TRUE(body.grid.particle(1, 1).movable);
}

TEST_F(ClothBuilderTest, SmallestCloth) {
    geometry = ClothGeometry{1.0f, 1.0f, 2, 2};
    ClothBody body = ClothBuilder::build(geometry, PinPattern{0, 0});
    EXPECT_EQ(body.grid.size(), 4u);
    EXPECT_EQ(body.constraints.size(), 6u);
    EXPECT_EQ(body.grid.movable_count(), 4u);
}

TEST_F(ClothBuilderTest, RejectsInvalidGeometry) {
    EXPECT_THROW(ClothBuilder::build(ClothGeometry{0.0f, 1.0f, 4, 4}), InvalidGeometry);
    EXPECT_THROW(ClothBuilder::build(ClothGeometry{1.0f, -1.0f, 4, 4}), InvalidGeometry);
    EXPECT_THROW(ClothBuilder::build(ClothGeometry{1.0f, 1.0f, 1, 4}), InvalidGeometry);
    EXPECT_THROW(ClothBuilder::build(ClothGeometry{1.0f, 1.0f, 4, 0}), InvalidGeometry);
    EXPECT_THROW(ClothBuilder::build(ClothGeometry{std::nanf(""), 1.0f, 4, 4}), InvalidGeometry);
}
