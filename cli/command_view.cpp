#include "cli_common.hpp"
#include <visualizer/visualizer.hpp>
#include <common/logging.hpp>

namespace drape::cli {

int command_view(int argc, char** argv) {
    auto log = drape::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (!visualization_available()) {
            log->error("Visualization not available - rebuild with GLFW and OpenGL");
            std::cerr << "Error: Visualization not available\n";
            return 1;
        }

        ClothSettings settings = load_settings(ctx.config_path);
        if (ctx.no_wind) {
            settings.config.enable_wind = false;
        }
        if (ctx.no_gravity) {
            settings.config.enable_gravity = false;
        }

        Cloth cloth(settings.geometry, settings.config);

        VisualizerConfig viz_config;
        VisualizerResult result = run_viewer(cloth, viz_config);

        log->info("Viewer closed after {} frames, {} ticks", result.frames, result.ticks);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace drape::cli
