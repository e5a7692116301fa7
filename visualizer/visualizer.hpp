#ifndef DRAPE_VISUALIZER_HPP
#define DRAPE_VISUALIZER_HPP

#include <cloth/cloth.hpp>
#include <cstdint>
#include <string>

namespace drape {

struct VisualizerConfig {
    int window_width = 1024;
    int window_height = 768;
    std::string window_title = "drape";

    float camera_distance = 25.0f;
    float rotation_speed = 0.5f;      // Mouse rotation speed
    float zoom_speed = 1.1f;          // Scroll zoom factor

    // Screen-space cursor delta to drag force, as (dx, -dy) * scale
    float drag_force_scale = 2.0f;

    // Frame deltas above this are clamped (debugger pauses, window moves)
    double max_frame_time = 0.25;

    int checker_tiles = 8;            // Checker pattern resolution over [0,1] texcoords
    bool auto_run = true;
};

struct VisualizerResult {
    bool completed = false;           // Window closed normally
    uint64_t frames = 0;
    uint64_t ticks = 0;
};

// Interactive viewer: drives cloth.update() from wall-clock time and
// draws the published buffers. Shift+click grabs the particle under the
// cursor; dragging pulls it. Returns when the window is closed.
VisualizerResult run_viewer(Cloth& cloth, const VisualizerConfig& config = VisualizerConfig{});

// Whether the viewer was compiled in (GLFW and OpenGL found)
bool visualization_available();

}  // namespace drape

#endif // DRAPE_VISUALIZER_HPP
