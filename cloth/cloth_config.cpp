#include "cloth_config.hpp"
#include "cloth_errors.hpp"
#include <cmath>
#include <string>

namespace drape {

void ClothGeometry::validate() const {
    if (!(width > 0.0f) || !std::isfinite(width)) {
        throw InvalidGeometry("width must be positive, got " + std::to_string(width));
    }
    if (!(height > 0.0f) || !std::isfinite(height)) {
        throw InvalidGeometry("height must be positive, got " + std::to_string(height));
    }
    if (cols < 2) {
        throw InvalidGeometry("need at least 2 particle columns, got " + std::to_string(cols));
    }
    if (rows < 2) {
        throw InvalidGeometry("need at least 2 particle rows, got " + std::to_string(rows));
    }
}

void ClothConfig::validate() const {
    if (!(fixed_step > 0.0) || !std::isfinite(fixed_step)) {
        throw InvalidConfig("fixed_step must be positive");
    }
    if (!(damping >= 0.0f && damping <= 1.0f)) {
        throw InvalidConfig("damping must be in [0, 1], got " + std::to_string(damping));
    }
    if (constraint_iterations < 0) {
        throw InvalidConfig("constraint_iterations must not be negative");
    }
    if (max_ticks_per_update < 0) {
        throw InvalidConfig("max_ticks_per_update must not be negative");
    }
    if (pins.top_left < 0 || pins.top_right < 0) {
        throw InvalidConfig("pin counts must not be negative");
    }
    if (!gravity.is_finite() || !wind.is_finite()) {
        throw InvalidConfig("gravity and wind must be finite");
    }
}

}  // namespace drape
