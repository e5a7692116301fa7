#ifndef DRAPE_CLOTH_MESH_HPP
#define DRAPE_CLOTH_MESH_HPP

#include "particle_grid.hpp"
#include <math/vec2.hpp>
#include <string>
#include <vector>

namespace drape {

// Non-indexed triangle list for the renderer: 6 vertices per quad,
// 6 * (cols - 1) * (rows - 1) entries in each buffer.
struct MeshBuffers {
    std::vector<Vec3> triangles;
    std::vector<Vec3> normals;
    std::vector<Vec2> tex_coords;

    size_t vertex_count() const { return triangles.size(); }
};

inline size_t mesh_vertex_count(const ParticleGrid& grid) {
    if (grid.cols() < 2 || grid.rows() < 2) {
        return 0;
    }
    return 6 * static_cast<size_t>(grid.cols() - 1) * static_cast<size_t>(grid.rows() - 1);
}

// Recomputes every accumulated_normal as the sum of the unit face
// normals of the particle's adjacent triangles.
void update_normals(ParticleGrid& grid);

// Writes positions, normalized accumulated normals and texture
// coordinates of every triangle vertex into `out`, resizing as needed.
void fill_mesh_buffers(const ParticleGrid& grid, MeshBuffers& out);

// Wavefront OBJ text: one v/vt/vn per buffer entry and one face per
// triangle.
std::string mesh_to_obj(const MeshBuffers& mesh);

}  // namespace drape

#endif // DRAPE_CLOTH_MESH_HPP
