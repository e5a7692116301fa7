#include "cli_common.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace drape::cli {

ClothSettings load_settings(const std::optional<std::string>& config_path) {
    ClothSettings settings;
    if (!config_path) {
        return settings;
    }

    auto log = drape::logging::get_logger();
    json::Document input = json::read_document(*config_path, json::FileKind::ClothConfig);

    if (input.data.contains("geometry")) {
        settings.geometry = input.data.at("geometry").get<ClothGeometry>();
    }
    if (input.data.contains("cloth")) {
        settings.config = input.data.at("cloth").get<ClothConfig>();
    }
    log->info("Loaded cloth settings from {}", *config_path);
    return settings;
}

int command_config(int argc, char** argv) {
    auto log = drape::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: drape config -o <config.json> [-c <base.json>]\n";
            std::cerr << "Writes the default (or the given base) configuration.\n";
            return 1;
        }

        ClothSettings settings = load_settings(ctx.config_path);
        settings.geometry.validate();
        settings.config.validate();

        json::Document doc;
        doc.kind = json::FileKind::ClothConfig;
        doc.created = json::utc_timestamp();
        if (ctx.config_path) {
            doc.source = *ctx.config_path;
        }
        doc.data = {
            {"geometry", settings.geometry},
            {"cloth", settings.config}
        };
        json::write_document(ctx.output_path, doc);

        log->info("Wrote configuration to {}", ctx.output_path);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace drape::cli
