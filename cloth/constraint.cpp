#include "constraint.hpp"
#include <stdexcept>
#include <string>

namespace drape {

namespace {

// Below this length the direction of p2 - p1 is meaningless
constexpr float kMinConstraintLength = 1e-6f;

}  // namespace

const char* to_string(ConstraintFamily family) {
    switch (family) {
        case ConstraintFamily::Structural: return "structural";
        case ConstraintFamily::Shear: return "shear";
        case ConstraintFamily::BendAxis: return "bend_axis";
        case ConstraintFamily::BendDiagonal: return "bend_diagonal";
    }
    return "unknown";
}

bool Constraint::satisfy(ParticleGrid& grid) const {
    Particle& a = grid.particle(p1);
    Particle& b = grid.particle(p2);

    Vec3 delta = b.position - a.position;
    float current_distance = delta.length();
    if (current_distance < kMinConstraintLength) {
        return false;
    }

    Vec3 correction = delta * (1.0f - rest_distance / current_distance);
    if (!a.movable) {
        b.offset(-correction);
    } else if (!b.movable) {
        a.offset(correction);
    } else {
        correction *= 0.5f;
        a.offset(correction);
        b.offset(-correction);
    }
    return true;
}

float Constraint::error(const ParticleGrid& grid) const {
    const auto& a = grid.particle(p1);
    const auto& b = grid.particle(p2);
    return a.position.distance_to(b.position) - rest_distance;
}

Constraint make_constraint(const ParticleGrid& grid,
                           ParticleId p1,
                           ParticleId p2,
                           ConstraintFamily family) {
    if (p1 >= grid.size() || p2 >= grid.size() || p1 == p2) {
        throw std::invalid_argument("make_constraint: invalid particle pair (" +
                                    std::to_string(p1) + ", " + std::to_string(p2) + ")");
    }

    Constraint constraint;
    constraint.p1 = p1;
    constraint.p2 = p2;
    constraint.family = family;
    constraint.rest_distance = grid.particle(p1).position.distance_to(grid.particle(p2).position);

    if (!(constraint.rest_distance > 0.0f)) {
        throw std::invalid_argument(std::string("make_constraint: zero rest distance for ") +
                                    to_string(family) + " constraint");
    }
    return constraint;
}

}  // namespace drape
