#ifndef DRAPE_CLOTH_FORCES_HPP
#define DRAPE_CLOTH_FORCES_HPP

#include "particle_grid.hpp"

namespace drape {

// Adds f to the acceleration of every particle, pinned ones included.
// Used for gravity; the caller scales by the tick length.
void add_uniform_force(ParticleGrid& grid, const Vec3& f);

// Simplified wind pressure. For every triangle with unnormalized face
// normal n, adds n * dot(normalize(n), dir) to each of its three
// vertices: proportional to the area projected along the wind.
// Triangles facing away receive a negative (pulling) contribution.
void add_wind_force(ParticleGrid& grid, const Vec3& dir);

// Adds a planar (dx, dy, 0) force to particle (x, y).
// Out-of-range coordinates are ignored. Returns whether it applied.
bool add_point_force(ParticleGrid& grid, int x, int y, float dx, float dy);

}  // namespace drape

#endif // DRAPE_CLOTH_FORCES_HPP
