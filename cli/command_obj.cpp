#include "cli_common.hpp"
#include <cloth/cloth_mesh.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/cloth_json.hpp>
#include <common/logging.hpp>

namespace drape::cli {

int command_obj(int argc, char** argv) {
    auto log = drape::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: drape obj <state.json> -o <output.obj>\n";
            return 1;
        }

        log->info("Exporting OBJ from: {}", ctx.input_path);

        json::Document input = json::read_document(ctx.input_path, json::FileKind::ClothState);
        MeshBuffers mesh = mesh_from_json(input.data.at("mesh"));

        std::string obj = mesh_to_obj(mesh);
        write_file(ctx.output_path, obj);

        log->info("Wrote OBJ to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << mesh.vertex_count() / 3 << " triangles, "
                  << obj.size() << " bytes)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace drape::cli
