#ifndef DRAPE_CLOTH_SOLVER_HPP
#define DRAPE_CLOTH_SOLVER_HPP

#include "cloth_builder.hpp"
#include "cloth_config.hpp"
#include <cstddef>
#include <vector>

namespace drape {

// Aggregate distance error over a constraint set
struct ConstraintError {
    float max = 0.0f;             // Largest |length - rest|
    float mean = 0.0f;            // Mean |length - rest|
};

// Position-based cloth solver: Verlet integration plus iterative
// distance-constraint relaxation.
class ClothSolver {
public:
    // One fixed tick: gravity and wind scaled by config.fixed_step,
    // constraint relaxation, then Verlet integration with
    // timestep = config.fixed_step.
    static void tick(ClothBody& body, const ClothConfig& config);

    // Verlet step for every movable particle:
    //   new = pos + (pos - old) * (1 - damping) + acceleration * dt
    // Acceleration is scaled by dt, not dt^2. Acceleration is cleared on
    // every particle, pinned or not.
    static void integrate_verlet(ParticleGrid& grid, float dt, float damping);

    // Runs `passes` Gauss-Seidel sweeps over all constraints in
    // construction order. Returns the number of constraint applications
    // skipped because both particles coincided.
    static size_t satisfy_constraints(ParticleGrid& grid,
                                      const std::vector<Constraint>& constraints,
                                      int passes);

    static ConstraintError constraint_error(const ParticleGrid& grid,
                                            const std::vector<Constraint>& constraints);
};

}  // namespace drape

#endif // DRAPE_CLOTH_SOLVER_HPP
