#ifndef DRAPE_CLOTH_PICKING_HPP
#define DRAPE_CLOTH_PICKING_HPP

#include "particle_grid.hpp"
#include <math/ray.hpp>
#include <optional>

namespace drape {

// Nearest ray hit on the cloth surface
struct PickHit {
    GridCoord coord;              // First-listed vertex of the hit triangle
    float distance = 0.0f;        // Ray parameter t of the hit
    Vec3 point;                   // ray.at(distance)
};

// Tests the ray against both triangles of every quad and returns the
// nearest hit. The reported grid coordinate is the first vertex of the
// hit triangle in its quad decomposition; equal distances keep the
// triangle visited first.
std::optional<PickHit> pick(const ParticleGrid& grid, const Ray& ray);

// Grabbed particle of an interactive drag, empty when idle
struct DragState {
    std::optional<GridCoord> target;

    bool active() const { return target.has_value(); }

    // Starts a drag at the picked particle. Returns whether the ray hit.
    bool begin(const ParticleGrid& grid, const Ray& ray);

    void release() { target.reset(); }
};

}  // namespace drape

#endif // DRAPE_CLOTH_PICKING_HPP
