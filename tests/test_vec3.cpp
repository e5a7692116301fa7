#include <gtest/gtest.h>
#include <math/vec3.hpp>
#include <math/vec2.hpp>
#include <cmath>
#include <limits>

using namespace drape;

TEST(Vec3Test, DefaultConstruction) {
    Vec3 v;
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
    EXPECT_FLOAT_EQ(v.z, 0.0f);
}

TEST(Vec3Test, Arithmetic) {
    Vec3 a(1.0f, 2.0f, 3.0f);
    Vec3 b(4.0f, 5.0f, 6.0f);

    Vec3 sum = a + b;
    EXPECT_FLOAT_EQ(sum.x, 5.0f);
    EXPECT_FLOAT_EQ(sum.y, 7.0f);
    EXPECT_FLOAT_EQ(sum.z, 9.0f);

    Vec3 diff = b - a;
    EXPECT_EQ(diff, Vec3(3.0f, 3.0f, 3.0f));

    EXPECT_EQ(a * 2.0f, Vec3(2.0f, 4.0f, 6.0f));
    EXPECT_EQ(2.0f * a, Vec3(2.0f, 4.0f, 6.0f));
    EXPECT_EQ(-a, Vec3(-1.0f, -2.0f, -3.0f));
}

TEST(Vec3Test, CompoundAssignment) {
    Vec3 v(1.0f, 1.0f, 1.0f);
    v += Vec3(1.0f, 2.0f, 3.0f);
    EXPECT_EQ(v, Vec3(2.0f, 3.0f, 4.0f));
    v *= 0.5f;
    EXPECT_EQ(v, Vec3(1.0f, 1.5f, 2.0f));
}

TEST(Vec3Test, DotProduct) {
    EXPECT_FLOAT_EQ(Vec3(1.0f, 0.0f, 0.0f).dot(Vec3(0.0f, 1.0f, 0.0f)), 0.0f);

    Vec3 c(1.0f, 2.0f, 3.0f);
    Vec3 d(4.0f, 5.0f, 6.0f);
    EXPECT_FLOAT_EQ(c.dot(d), 32.0f);
}

TEST(Vec3Test, CrossProduct) {
    const Vec3 ex(1.0f, 0.0f, 0.0f);
    const Vec3 ey(0.0f, 1.0f, 0.0f);
    Vec3 z = ex.cross(ey);
    EXPECT_FLOAT_EQ(z.x, 0.0f);
    EXPECT_FLOAT_EQ(z.y, 0.0f);
    EXPECT_FLOAT_EQ(z.z, 1.0f);

    // Anticommutative
    EXPECT_EQ(ey.cross(ex), Vec3(0.0f, 0.0f, -1.0f));
}

TEST(Vec3Test, Length) {
    Vec3 v(3.0f, 4.0f, 0.0f);
    EXPECT_FLOAT_EQ(v.length(), 5.0f);
    EXPECT_FLOAT_EQ(v.length_squared(), 25.0f);
    EXPECT_FLOAT_EQ(v.distance_to(vec3::zero()), 5.0f);
}

TEST(Vec3Test, Normalized) {
    Vec3 v(3.0f, 4.0f, 0.0f);
    Vec3 n = v.normalized();
    EXPECT_FLOAT_EQ(n.length(), 1.0f);
    EXPECT_FLOAT_EQ(n.x, 0.6f);
    EXPECT_FLOAT_EQ(n.y, 0.8f);
}

TEST(Vec3Test, NormalizedZeroStaysZero) {
    Vec3 n = vec3::zero().normalized();
    EXPECT_EQ(n, vec3::zero());
    EXPECT_TRUE(n.is_finite());
}

TEST(Vec3Test, IsFinite) {
    EXPECT_TRUE(Vec3(1.0f, 2.0f, 3.0f).is_finite());
    EXPECT_FALSE(Vec3(std::numeric_limits<float>::infinity(), 0.0f, 0.0f).is_finite());
    EXPECT_FALSE(Vec3(0.0f, std::nanf(""), 0.0f).is_finite());
}

TEST(Vec2Test, Equality) {
    EXPECT_EQ(Vec2(0.5f, 1.0f), Vec2(0.5f, 1.0f));
    EXPECT_NE(Vec2(0.5f, 1.0f), Vec2(1.0f, 0.5f));
}
