#include "cloth_solver.hpp"
#include "cloth_forces.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace drape {

void ClothSolver::tick(ClothBody& body, const ClothConfig& config) {
    const float dt = static_cast<float>(config.fixed_step);

    // 1. External forces
    if (config.enable_gravity) {
        add_uniform_force(body.grid, config.gravity * dt);
    }
    if (config.enable_wind) {
        add_wind_force(body.grid, config.wind * dt);
    }

    // 2. Relaxation
    size_t skipped = satisfy_constraints(body.grid, body.constraints,
                                         config.constraint_iterations);
    if (skipped > 0) {
        auto log = drape::logging::get_logger();
        log->trace("ClothSolver: skipped {} degenerate constraint applications", skipped);
    }

    // 3. Integration
    integrate_verlet(body.grid, dt, config.damping);
}

void ClothSolver::integrate_verlet(ParticleGrid& grid, float dt, float damping) {
    auto& particles = grid.particles();
    const float keep = 1.0f - damping;

    // Each particle only reads and writes its own state
    #pragma omp parallel for schedule(static) if(particles.size() > 256)
    for (size_t i = 0; i < particles.size(); ++i) {
        auto& p = particles[i];
        if (p.movable) {
            Vec3 previous = p.position;
            p.position = p.position + (p.position - p.old_position) * keep + p.acceleration * dt;
            p.old_position = previous;
        }
        p.acceleration = vec3::zero();
    }
}

size_t ClothSolver::satisfy_constraints(ParticleGrid& grid,
                                        const std::vector<Constraint>& constraints,
                                        int passes) {
    size_t skipped = 0;
    for (int pass = 0; pass < passes; ++pass) {
        for (const auto& constraint : constraints) {
            if (!constraint.satisfy(grid)) {
                ++skipped;
            }
        }
    }
    return skipped;
}

ConstraintError ClothSolver::constraint_error(const ParticleGrid& grid,
                                              const std::vector<Constraint>& constraints) {
    ConstraintError result;
    if (constraints.empty()) {
        return result;
    }

    double total = 0.0;
    for (const auto& constraint : constraints) {
        float e = std::abs(constraint.error(grid));
        result.max = std::max(result.max, e);
        total += e;
    }
    result.mean = static_cast<float>(total / static_cast<double>(constraints.size()));
    return result;
}

}  // namespace drape
