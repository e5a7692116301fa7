#include "particle_grid.hpp"
#include <stdexcept>
#include <string>

namespace drape {

ParticleGrid::ParticleGrid(int cols, int rows)
    : cols_(cols), rows_(rows) {
    if (cols < 0 || rows < 0) {
        throw std::invalid_argument("ParticleGrid: negative dimensions");
    }
    particles_.resize(static_cast<size_t>(cols) * static_cast<size_t>(rows));
}

Particle& ParticleGrid::particle(ParticleId id) {
    if (id >= particles_.size()) {
        throw std::out_of_range("ParticleGrid::particle: invalid particle id " +
                                std::to_string(id));
    }
    return particles_[id];
}

const Particle& ParticleGrid::particle(ParticleId id) const {
    if (id >= particles_.size()) {
        throw std::out_of_range("ParticleGrid::particle: invalid particle id " +
                                std::to_string(id));
    }
    return particles_[id];
}

Particle& ParticleGrid::particle(int x, int y) {
    if (!in_bounds(x, y)) {
        throw std::out_of_range("ParticleGrid::particle: coordinate (" +
                                std::to_string(x) + ", " + std::to_string(y) +
                                ") outside grid");
    }
    return particles_[index(x, y)];
}

const Particle& ParticleGrid::particle(int x, int y) const {
    if (!in_bounds(x, y)) {
        throw std::out_of_range("ParticleGrid::particle: coordinate (" +
                                std::to_string(x) + ", " + std::to_string(y) +
                                ") outside grid");
    }
    return particles_[index(x, y)];
}

void ParticleGrid::offset(ParticleId id, const Vec3& delta) {
    particle(id).offset(delta);
}

void ParticleGrid::add_force(ParticleId id, const Vec3& f) {
    particle(id).add_force(f);
}

void ParticleGrid::reset_normal(ParticleId id) {
    particle(id).reset_normal();
}

void ParticleGrid::add_normal(ParticleId id, const Vec3& face_normal) {
    particle(id).add_normal(face_normal);
}

void ParticleGrid::reset_all_normals() {
    #pragma omp parallel for schedule(static) if(particles_.size() > 256)
    for (size_t i = 0; i < particles_.size(); ++i) {
        particles_[i].reset_normal();
    }
}

size_t ParticleGrid::movable_count() const {
    size_t count = 0;
    for (const auto& p : particles_) {
        if (p.movable) {
            ++count;
        }
    }
    return count;
}

}  // namespace drape
