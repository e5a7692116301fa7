#ifndef DRAPE_MATH_VEC2_HPP
#define DRAPE_MATH_VEC2_HPP

namespace drape {

// Texture coordinate pair, packed like Vec3 for direct upload.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

}  // namespace drape

#endif // DRAPE_MATH_VEC2_HPP
