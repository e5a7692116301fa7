#ifndef DRAPE_SERIALIZATION_CLOTH_JSON_HPP
#define DRAPE_SERIALIZATION_CLOTH_JSON_HPP

#include <nlohmann/json.hpp>
#include <cloth/cloth.hpp>
#include <cloth/cloth_mesh.hpp>
#include <cloth/particle.hpp>
#include "config_json.hpp"

namespace drape {

NLOHMANN_JSON_SERIALIZE_ENUM(ConstraintFamily, {
    {ConstraintFamily::Structural, "structural"},
    {ConstraintFamily::Shear, "shear"},
    {ConstraintFamily::BendAxis, "bend_axis"},
    {ConstraintFamily::BendDiagonal, "bend_diagonal"},
})

inline void to_json(nlohmann::json& j, const Particle& p) {
    j["position"] = p.position;
    j["old_position"] = p.old_position;
    j["tex_coord"] = p.tex_coord;
    j["movable"] = p.movable;
}

inline void to_json(nlohmann::json& j, const Constraint& c) {
    j["p1"] = c.p1;
    j["p2"] = c.p2;
    j["rest_distance"] = c.rest_distance;
    j["family"] = c.family;
}

inline nlohmann::json mesh_to_json(const MeshBuffers& mesh) {
    nlohmann::json j;
    j["triangles"] = mesh.triangles;
    j["normals"] = mesh.normals;
    j["tex_coords"] = mesh.tex_coords;
    return j;
}

// Throws std::runtime_error when the buffers disagree in length
inline MeshBuffers mesh_from_json(const nlohmann::json& j) {
    MeshBuffers mesh;
    mesh.triangles = j.at("triangles").get<std::vector<Vec3>>();
    mesh.normals = j.at("normals").get<std::vector<Vec3>>();
    mesh.tex_coords = j.at("tex_coords").get<std::vector<Vec2>>();
    if (mesh.normals.size() != mesh.triangles.size() ||
        mesh.tex_coords.size() != mesh.triangles.size() ||
        mesh.triangles.size() % 3 != 0) {
        throw std::runtime_error("Mesh buffers have inconsistent lengths");
    }
    return mesh;
}

// Full cloth state. Constraints are only included on request since
// they can be regenerated from the geometry.
inline nlohmann::json cloth_to_json(const Cloth& cloth, bool include_constraints = false) {
    nlohmann::json j;
    j["cols"] = cloth.grid().cols();
    j["rows"] = cloth.grid().rows();
    j["particles"] = cloth.grid().particles();
    if (include_constraints) {
        j["constraints"] = cloth.constraints();
    }
    j["mesh"] = mesh_to_json(cloth.mesh());
    return j;
}

}  // namespace drape

#endif // DRAPE_SERIALIZATION_CLOTH_JSON_HPP
