#ifndef DRAPE_CLOTH_CONFIG_HPP
#define DRAPE_CLOTH_CONFIG_HPP

#include <math/vec3.hpp>

namespace drape {

// Physical extent and lattice resolution of the cloth
struct ClothGeometry {
    float width = 10.0f;          // Extent along +x
    float height = 14.0f;         // Extent along -y
    int cols = 22;                // Particles per row
    int rows = 26;                // Particles per column

    // Throws InvalidGeometry
    void validate() const;
};

// Particles of row 0 pinned at construction.
// The pin set is permanent for the lifetime of the cloth.
struct PinPattern {
    int top_left = 3;             // Leading columns of row 0
    int top_right = 3;            // Trailing columns of row 0
};

// Simulation tunables
struct ClothConfig {
    // Physics step in seconds, independent of the frame rate
    double fixed_step = 1.0 / 120.0;

    // Fraction of the implicit velocity lost per step
    float damping = 0.01f;

    // Relaxation passes over all constraints per tick
    int constraint_iterations = 30;

    // Uniform acceleration applied each tick, scaled by fixed_step
    Vec3 gravity{0.0f, -2.8f, 0.0f};
    bool enable_gravity = true;

    // Wind direction/strength applied per triangle each tick, scaled by fixed_step
    Vec3 wind{10.5f, 0.0f, 0.2f};
    bool enable_wind = true;

    // Upper bound of ticks per update (0 = unbounded). Surplus time is dropped.
    int max_ticks_per_update = 0;

    PinPattern pins;

    // Throws InvalidConfig
    void validate() const;
};

}  // namespace drape

#endif // DRAPE_CLOTH_CONFIG_HPP
