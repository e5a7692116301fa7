#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Verlet cloth simulation.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  simulate   Run the simulation headless and write a state snapshot (.json)\n";
    std::cerr << "  obj        Export the mesh of a state snapshot as Wavefront OBJ\n";
    std::cerr << "  config     Write a configuration file with default settings\n";
    std::cerr << "  view       Open the interactive viewer\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c, --config FILE   Configuration file\n";
    std::cerr << "  -o, --output FILE   Output file\n";
    std::cerr << "  -v, --verbose       Progress output\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  DRAPE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "simulate") {
        return drape::cli::command_simulate(argc, argv);
    } else if (command == "obj") {
        return drape::cli::command_obj(argc, argv);
    } else if (command == "config") {
        return drape::cli::command_config(argc, argv);
    } else if (command == "view") {
        return drape::cli::command_view(argc, argv);
    }

    auto log = drape::logging::get_logger();
    log->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
