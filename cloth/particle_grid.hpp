#ifndef DRAPE_CLOTH_PARTICLE_GRID_HPP
#define DRAPE_CLOTH_PARTICLE_GRID_HPP

#include "particle.hpp"
#include <cstddef>
#include <vector>

namespace drape {

// Grid coordinate of a particle. Signed so that neighbour arithmetic
// (x - 1, y - 1) on an edge particle stays representable and can be
// rejected by in_bounds().
struct GridCoord {
    int x = 0;
    int y = 0;

    constexpr bool operator==(const GridCoord& other) const {
        return x == other.x && y == other.y;
    }
};

// Flat, exclusively owned W x H particle array.
// Particle (x, y) lives at index y * W + x.
class ParticleGrid {
public:
    ParticleGrid() = default;
    ParticleGrid(int cols, int rows);

    int cols() const { return cols_; }
    int rows() const { return rows_; }
    size_t size() const { return particles_.size(); }

    bool in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < cols_ && y < rows_;
    }

    ParticleId index(int x, int y) const {
        return static_cast<ParticleId>(y * cols_ + x);
    }

    GridCoord coord(ParticleId id) const {
        return {static_cast<int>(id) % cols_, static_cast<int>(id) / cols_};
    }

    // Checked accessors, throw std::out_of_range
    Particle& particle(ParticleId id);
    const Particle& particle(ParticleId id) const;
    Particle& particle(int x, int y);
    const Particle& particle(int x, int y) const;

    std::vector<Particle>& particles() { return particles_; }
    const std::vector<Particle>& particles() const { return particles_; }

    // Mutation gate for positions: a no-op on pinned particles
    void offset(ParticleId id, const Vec3& delta);

    void add_force(ParticleId id, const Vec3& f);
    void reset_normal(ParticleId id);
    void add_normal(ParticleId id, const Vec3& face_normal);

    void reset_all_normals();
    size_t movable_count() const;

private:
    int cols_ = 0;
    int rows_ = 0;
    std::vector<Particle> particles_;
};

}  // namespace drape

#endif // DRAPE_CLOTH_PARTICLE_GRID_HPP
