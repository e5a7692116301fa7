#ifndef DRAPE_CLOTH_CONSTRAINT_HPP
#define DRAPE_CLOTH_CONSTRAINT_HPP

#include "particle_grid.hpp"
#include <cstdint>

namespace drape {

using ConstraintId = uint32_t;

// Which lattice relation a constraint was generated from
enum class ConstraintFamily {
    Structural,   // Axis neighbours, grid distance 1
    Shear,        // Diagonal neighbours, grid distance sqrt(2)
    BendAxis,     // Axis neighbours two apart
    BendDiagonal  // Diagonal neighbours two apart
};

const char* to_string(ConstraintFamily family);

// Pairwise distance constraint between two particles of the grid.
// rest_distance is captured once at construction and never mutated.
struct Constraint {
    ParticleId p1 = 0;
    ParticleId p2 = 0;
    float rest_distance = 1.0f;
    ConstraintFamily family = ConstraintFamily::Structural;

    // One relaxation step. Each particle is moved half of the error
    // towards (or away from) its partner; a pinned particle absorbs
    // nothing, so its partner receives the full correction.
    // Returns false when the particles coincide and the constraint was
    // skipped.
    bool satisfy(ParticleGrid& grid) const;

    // Signed distance error: current length minus rest distance
    float error(const ParticleGrid& grid) const;
};

// Builds a constraint whose rest distance is the current distance between
// p1 and p2. Throws std::invalid_argument for out-of-range ids or for
// coincident particles.
Constraint make_constraint(const ParticleGrid& grid,
                           ParticleId p1,
                           ParticleId p2,
                           ConstraintFamily family);

}  // namespace drape

#endif // DRAPE_CLOTH_CONSTRAINT_HPP
