#ifndef DRAPE_CLOTH_BUILDER_HPP
#define DRAPE_CLOTH_BUILDER_HPP

#include "particle_grid.hpp"
#include "constraint.hpp"
#include "cloth_config.hpp"
#include <vector>

namespace drape {

// Particle lattice plus the constraints generated from its topology
struct ClothBody {
    ParticleGrid grid;
    std::vector<Constraint> constraints;
};

// Builds the initial cloth state: particles laid out on the rectangle
// (0,0,0)..(width,-height,0), four constraint families and the pinned
// top-row particles.
class ClothBuilder {
public:
    // Throws InvalidGeometry
    static ClothBody build(const ClothGeometry& geometry,
                           const PinPattern& pins = PinPattern{});

private:
    ClothBuilder(const ClothGeometry& geometry, const PinPattern& pins);

    void create_particles();
    void create_neighbor_constraints();
    void create_bend_constraints();
    void pin_top_row();

    void connect(int x1, int y1, int x2, int y2, ConstraintFamily family);

    ClothGeometry geometry_;
    PinPattern pins_;
    ClothBody body_;
};

}  // namespace drape

#endif // DRAPE_CLOTH_BUILDER_HPP
