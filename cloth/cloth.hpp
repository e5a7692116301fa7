#ifndef DRAPE_CLOTH_HPP
#define DRAPE_CLOTH_HPP

#include "cloth_builder.hpp"
#include "cloth_config.hpp"
#include "cloth_mesh.hpp"
#include "cloth_picking.hpp"
#include "cloth_solver.hpp"
#include "fixed_step.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace drape {

struct ClothStats {
    size_t particles = 0;
    size_t pinned = 0;
    size_t constraints = 0;
    size_t structural = 0;
    size_t shear = 0;
    size_t bend = 0;
    uint64_t ticks = 0;           // Fixed ticks run since construction
    uint64_t dropped_ticks = 0;   // Ticks discarded by max_ticks_per_update
};

// A simulated cloth sheet.
//
// Owns the particle lattice and constraint set, advances them with a
// fixed-step driver and publishes a renderable triangle list. The
// published buffers only change at the end of an update() that ran at
// least one tick, never mid-relaxation.
//
// Not thread-safe: all calls must come from the thread driving the
// frame loop. External forces (add_force, add_wind_force, mouse_force)
// accumulate until the next tick consumes them.
class Cloth {
public:
    // Throws InvalidGeometry or InvalidConfig
    explicit Cloth(const ClothGeometry& geometry, const ClothConfig& config = ClothConfig{});

    static Cloth create(float width, float height, int cols, int rows,
                        const ClothConfig& config = ClothConfig{});

    // Runs the fixed-step driver. Returns the number of ticks run; the
    // mesh is rebuilt and republished only when that is nonzero.
    int update(std::chrono::duration<double> dt);

    // Uniform force into every particle
    void add_force(const Vec3& force);

    // Per-triangle wind pressure
    void add_wind_force(const Vec3& direction);

    // Planar force (dx, dy, 0) on particle (x, y); no-op out of range
    void mouse_force(int x, int y, float dx, float dy);

    // mouse_force on (x, y) and its diagonal neighbours (x-1, y-1),
    // (x+1, y+1) for a softer pull
    void drag(int x, int y, float dx, float dy);

    // Grid coordinate of the nearest hit triangle's first vertex
    std::optional<GridCoord> intersects(const Ray& ray) const;

    // Published render buffers, 6 * (cols - 1) * (rows - 1) entries each
    const std::vector<Vec3>& triangles() const { return mesh_.triangles; }
    const std::vector<Vec3>& normals() const { return mesh_.normals; }
    const std::vector<Vec2>& tex_coords() const { return mesh_.tex_coords; }
    const MeshBuffers& mesh() const { return mesh_; }

    const ParticleGrid& grid() const { return body_.grid; }
    const std::vector<Constraint>& constraints() const { return body_.constraints; }
    const ClothGeometry& geometry() const { return geometry_; }
    const ClothConfig& config() const { return config_; }

    void set_wind_enabled(bool enabled) { config_.enable_wind = enabled; }
    void set_gravity_enabled(bool enabled) { config_.enable_gravity = enabled; }

    int last_update_ticks() const { return last_update_ticks_; }
    double pending_time() const { return driver_.accumulator(); }
    ClothStats stats() const;
    ConstraintError constraint_error() const;

private:
    void rebuild_mesh();

    ClothGeometry geometry_;
    ClothConfig config_;
    ClothBody body_;
    FixedStepDriver driver_;
    MeshBuffers mesh_;
    int last_update_ticks_ = 0;
};

}  // namespace drape

#endif // DRAPE_CLOTH_HPP
