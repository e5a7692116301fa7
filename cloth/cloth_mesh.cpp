#include "cloth_mesh.hpp"
#include "triangles.hpp"
#include <initializer_list>
#include <iomanip>
#include <sstream>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace drape {

void update_normals(ParticleGrid& grid) {
    grid.reset_all_normals();

    auto& particles = grid.particles();
    for_each_triangle(grid, [&](const Triangle& tri) {
        Vec3 normal = face_normal(grid, tri);
        particles[tri.a].add_normal(normal);
        particles[tri.b].add_normal(normal);
        particles[tri.c].add_normal(normal);
    });
}

void fill_mesh_buffers(const ParticleGrid& grid, MeshBuffers& out) {
    const size_t count = mesh_vertex_count(grid);
    out.triangles.resize(count);
    out.normals.resize(count);
    out.tex_coords.resize(count);
    if (count == 0) {
        return;
    }

    const auto& particles = grid.particles();
    const int quad_rows = grid.rows() - 1;
    const int quads = static_cast<int>(count / 6);

    // Every quad writes its own six slots
    #pragma omp parallel for schedule(static) if(quads > 64)
    for (int q = 0; q < quads; ++q) {
        const int x = q / quad_rows;
        const int y = q % quad_rows;
        size_t slot = static_cast<size_t>(q) * 6;
        for (const Triangle& tri : quad_triangles(grid, x, y)) {
            for (ParticleId id : {tri.a, tri.b, tri.c}) {
                const Particle& p = particles[id];
                out.triangles[slot] = p.position;
                out.normals[slot] = p.accumulated_normal.normalized();
                out.tex_coords[slot] = p.tex_coord;
                ++slot;
            }
        }
    }
}

std::string mesh_to_obj(const MeshBuffers& mesh) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "# drape cloth mesh\n";
    oss << "# " << mesh.vertex_count() << " vertices, "
        << mesh.vertex_count() / 3 << " triangles\n";
    oss << "o cloth\n";

    for (const auto& v : mesh.triangles) {
        oss << "v " << v.x << " " << v.y << " " << v.z << "\n";
    }
    for (const auto& t : mesh.tex_coords) {
        oss << "vt " << t.x << " " << t.y << "\n";
    }
    for (const auto& n : mesh.normals) {
        oss << "vn " << n.x << " " << n.y << " " << n.z << "\n";
    }

    for (size_t i = 0; i + 2 < mesh.vertex_count(); i += 3) {
        oss << "f";
        for (size_t k = 1; k <= 3; ++k) {
            size_t idx = i + k;
            oss << " " << idx << "/" << idx << "/" << idx;
        }
        oss << "\n";
    }

    return oss.str();
}

}  // namespace drape
