#include "cloth_builder.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace drape {

ClothBody ClothBuilder::build(const ClothGeometry& geometry, const PinPattern& pins) {
    geometry.validate();

    ClothBuilder builder(geometry, pins);
    builder.create_particles();
    builder.create_neighbor_constraints();
    builder.create_bend_constraints();
    builder.pin_top_row();

    auto log = drape::logging::get_logger();
    log->info("ClothBuilder: {}x{} particles ({} pinned), {} constraints",
              geometry.cols, geometry.rows,
              builder.body_.grid.size() - builder.body_.grid.movable_count(),
              builder.body_.constraints.size());

    return std::move(builder.body_);
}

ClothBuilder::ClothBuilder(const ClothGeometry& geometry, const PinPattern& pins)
    : geometry_(geometry), pins_(pins) {
}

void ClothBuilder::create_particles() {
    body_.grid = ParticleGrid(geometry_.cols, geometry_.rows);

    const float step_x = geometry_.width / static_cast<float>(geometry_.cols - 1);
    const float step_y = geometry_.height / static_cast<float>(geometry_.rows - 1);

    for (int y = 0; y < geometry_.rows; ++y) {
        for (int x = 0; x < geometry_.cols; ++x) {
            Particle& p = body_.grid.particle(x, y);
            p.position = Vec3(step_x * x, -step_y * y, 0.0f);
            p.old_position = p.position;
            p.acceleration = vec3::zero();
            p.accumulated_normal = vec3::zero();
            p.tex_coord = Vec2(p.position.x / geometry_.width,
                               std::abs(p.position.y) / geometry_.height);
            p.movable = true;
        }
    }
}

void ClothBuilder::connect(int x1, int y1, int x2, int y2, ConstraintFamily family) {
    const auto& grid = body_.grid;
    body_.constraints.push_back(
        make_constraint(grid, grid.index(x1, y1), grid.index(x2, y2), family));
}

// Distance 1 and sqrt(2) in the lattice. Every pair is visited once,
// from its lower-x / lower-y end.
void ClothBuilder::create_neighbor_constraints() {
    auto log = drape::logging::get_logger();
    const int w = geometry_.cols;
    const int h = geometry_.rows;
    const size_t before = body_.constraints.size();

    for (int x = 0; x < w; ++x) {
        for (int y = 0; y < h; ++y) {
            if (x < w - 1) {
                connect(x, y, x + 1, y, ConstraintFamily::Structural);
            }
            if (y < h - 1) {
                connect(x, y, x, y + 1, ConstraintFamily::Structural);
            }
            if (x < w - 1 && y < h - 1) {
                connect(x, y, x + 1, y + 1, ConstraintFamily::Shear);
                connect(x + 1, y, x, y + 1, ConstraintFamily::Shear);
            }
        }
    }

    log->debug("ClothBuilder: created {} structural/shear constraints",
               body_.constraints.size() - before);
}

// Distance 2 and 2*sqrt(2); these resist folding along grid lines
void ClothBuilder::create_bend_constraints() {
    auto log = drape::logging::get_logger();
    const int w = geometry_.cols;
    const int h = geometry_.rows;
    const size_t before = body_.constraints.size();

    for (int x = 0; x < w; ++x) {
        for (int y = 0; y < h; ++y) {
            if (x < w - 2) {
                connect(x, y, x + 2, y, ConstraintFamily::BendAxis);
            }
            if (y < h - 2) {
                connect(x, y, x, y + 2, ConstraintFamily::BendAxis);
            }
            if (x < w - 2 && y < h - 2) {
                connect(x, y, x + 2, y + 2, ConstraintFamily::BendDiagonal);
                connect(x + 2, y, x, y + 2, ConstraintFamily::BendDiagonal);
            }
        }
    }

    log->debug("ClothBuilder: created {} bend constraints",
               body_.constraints.size() - before);
}

void ClothBuilder::pin_top_row() {
    const int w = geometry_.cols;
    const int left = std::min(pins_.top_left, w);
    const int right = std::min(pins_.top_right, w);

    for (int i = 0; i < left; ++i) {
        body_.grid.particle(i, 0).make_unmovable();
    }
    for (int i = 0; i < right; ++i) {
        body_.grid.particle(w - 1 - i, 0).make_unmovable();
    }
}

}  // namespace drape
