#include "cloth_picking.hpp"
#include "triangles.hpp"
#include "logging.hpp"

namespace drape {

std::optional<PickHit> pick(const ParticleGrid& grid, const Ray& ray) {
    std::optional<PickHit> best;
    const auto& particles = grid.particles();

    for_each_triangle(grid, [&](const Triangle& tri) {
        auto t = intersect_triangle(ray,
                                    particles[tri.a].position,
                                    particles[tri.b].position,
                                    particles[tri.c].position);
        if (!t) {
            return;
        }
        if (!best || *t < best->distance) {
            best = PickHit{grid.coord(tri.a), *t, ray.at(*t)};
        }
    });

    return best;
}

bool DragState::begin(const ParticleGrid& grid, const Ray& ray) {
    auto hit = pick(grid, ray);
    if (!hit) {
        target.reset();
        return false;
    }

    target = hit->coord;
    auto log = drape::logging::get_logger();
    log->debug("DragState: grabbed particle ({}, {}) at t={:.3f}",
               hit->coord.x, hit->coord.y, hit->distance);
    return true;
}

}  // namespace drape
