#ifndef DRAPE_SERIALIZATION_CONFIG_JSON_HPP
#define DRAPE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <cloth/cloth.hpp>
#include <cloth/cloth_config.hpp>

namespace drape {

inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
    v.z = j.at(2).get<float>();
}

inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
}

inline void to_json(nlohmann::json& j, const ClothGeometry& geometry) {
    j = {
        {"width", geometry.width},
        {"height", geometry.height},
        {"cols", geometry.cols},
        {"rows", geometry.rows}
    };
}

inline void from_json(const nlohmann::json& j, ClothGeometry& geometry) {
    ClothGeometry defaults;
    geometry.width = j.value("width", defaults.width);
    geometry.height = j.value("height", defaults.height);
    geometry.cols = j.value("cols", defaults.cols);
    geometry.rows = j.value("rows", defaults.rows);
}

inline void to_json(nlohmann::json& j, const PinPattern& pins) {
    j = {
        {"top_left", pins.top_left},
        {"top_right", pins.top_right}
    };
}

inline void from_json(const nlohmann::json& j, PinPattern& pins) {
    pins.top_left = j.value("top_left", 3);
    pins.top_right = j.value("top_right", 3);
}

inline void to_json(nlohmann::json& j, const ClothConfig& config) {
    j = {
        {"fixed_step", config.fixed_step},
        {"damping", config.damping},
        {"constraint_iterations", config.constraint_iterations},
        {"gravity", config.gravity},
        {"enable_gravity", config.enable_gravity},
        {"wind", config.wind},
        {"enable_wind", config.enable_wind},
        {"max_ticks_per_update", config.max_ticks_per_update},
        {"pins", config.pins}
    };
}

inline void from_json(const nlohmann::json& j, ClothConfig& config) {
    ClothConfig defaults;
    config.fixed_step = j.value("fixed_step", defaults.fixed_step);
    config.damping = j.value("damping", defaults.damping);
    config.constraint_iterations = j.value("constraint_iterations", defaults.constraint_iterations);
    config.gravity = defaults.gravity;
    if (j.contains("gravity")) {
        config.gravity = j["gravity"].get<Vec3>();
    }
    config.enable_gravity = j.value("enable_gravity", defaults.enable_gravity);
    config.wind = defaults.wind;
    if (j.contains("wind")) {
        config.wind = j["wind"].get<Vec3>();
    }
    config.enable_wind = j.value("enable_wind", defaults.enable_wind);
    config.max_ticks_per_update = j.value("max_ticks_per_update", defaults.max_ticks_per_update);
    config.pins = defaults.pins;
    if (j.contains("pins")) {
        config.pins = j["pins"].get<PinPattern>();
    }
}

inline void to_json(nlohmann::json& j, const ClothStats& stats) {
    j = {
        {"particles", stats.particles},
        {"pinned", stats.pinned},
        {"constraints", stats.constraints},
        {"structural", stats.structural},
        {"shear", stats.shear},
        {"bend", stats.bend},
        {"ticks", stats.ticks},
        {"dropped_ticks", stats.dropped_ticks}
    };
}

inline void to_json(nlohmann::json& j, const ConstraintError& error) {
    j = {
        {"max", error.max},
        {"mean", error.mean}
    };
}

}  // namespace drape

#endif // DRAPE_SERIALIZATION_CONFIG_JSON_HPP
