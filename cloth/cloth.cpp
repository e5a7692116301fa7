#include "cloth.hpp"
#include "cloth_forces.hpp"
#include "logging.hpp"

namespace drape {

namespace {

const ClothConfig& validated(const ClothConfig& config) {
    config.validate();
    return config;
}

}  // namespace

Cloth::Cloth(const ClothGeometry& geometry, const ClothConfig& config)
    : geometry_(geometry),
      config_(validated(config)),
      body_(ClothBuilder::build(geometry, config.pins)),
      driver_(config.fixed_step, config.max_ticks_per_update) {
    rebuild_mesh();

    auto log = drape::logging::get_logger();
    log->info("Cloth: {}x{} sheet, step={:.5f}s, damping={}, {} relaxation passes",
              geometry_.width, geometry_.height, config_.fixed_step,
              config_.damping, config_.constraint_iterations);
}

Cloth Cloth::create(float width, float height, int cols, int rows,
                    const ClothConfig& config) {
    return Cloth(ClothGeometry{width, height, cols, rows}, config);
}

int Cloth::update(std::chrono::duration<double> dt) {
    last_update_ticks_ = driver_.advance(dt.count(), [this]() {
        ClothSolver::tick(body_, config_);
    });

    if (last_update_ticks_ > 0) {
        rebuild_mesh();
    }
    return last_update_ticks_;
}

void Cloth::add_force(const Vec3& force) {
    add_uniform_force(body_.grid, force);
}

void Cloth::add_wind_force(const Vec3& direction) {
    drape::add_wind_force(body_.grid, direction);
}

void Cloth::mouse_force(int x, int y, float dx, float dy) {
    add_point_force(body_.grid, x, y, dx, dy);
}

void Cloth::drag(int x, int y, float dx, float dy) {
    mouse_force(x, y, dx, dy);
    mouse_force(x - 1, y - 1, dx, dy);
    mouse_force(x + 1, y + 1, dx, dy);
}

std::optional<GridCoord> Cloth::intersects(const Ray& ray) const {
    auto hit = pick(body_.grid, ray);
    if (!hit) {
        return std::nullopt;
    }
    return hit->coord;
}

ClothStats Cloth::stats() const {
    ClothStats s;
    s.particles = body_.grid.size();
    s.pinned = s.particles - body_.grid.movable_count();
    s.constraints = body_.constraints.size();
    for (const auto& c : body_.constraints) {
        switch (c.family) {
            case ConstraintFamily::Structural: ++s.structural; break;
            case ConstraintFamily::Shear: ++s.shear; break;
            case ConstraintFamily::BendAxis:
            case ConstraintFamily::BendDiagonal: ++s.bend; break;
        }
    }
    s.ticks = driver_.total_ticks();
    s.dropped_ticks = driver_.dropped_ticks();
    return s;
}

ConstraintError Cloth::constraint_error() const {
    return ClothSolver::constraint_error(body_.grid, body_.constraints);
}

void Cloth::rebuild_mesh() {
    update_normals(body_.grid);
    fill_mesh_buffers(body_.grid, mesh_);
}

}  // namespace drape
