#ifndef DRAPE_CLI_COMMON_HPP
#define DRAPE_CLI_COMMON_HPP

#include <cloth/cloth_config.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace drape::cli {

// Options shared by all subcommands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;

    // simulate
    double seconds = 5.0;
    double fps = 60.0;
    bool no_wind = false;
    bool no_gravity = false;
    bool with_constraints = false;
};

inline double parse_positive(const std::string& flag, const std::string& value) {
    double parsed = 0.0;
    try {
        parsed = std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    if (!(parsed > 0.0)) {
        throw std::runtime_error(flag + " must be positive");
    }
    return parsed;
}

// Parses flags and the optional positional input path, starting at
// argv[start_idx]. Throws std::runtime_error on unknown options.
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value(arg);
        } else if (arg == "--seconds") {
            ctx.seconds = parse_positive(arg, require_value(arg));
        } else if (arg == "--fps") {
            ctx.fps = parse_positive(arg, require_value(arg));
        } else if (arg == "--no-wind") {
            ctx.no_wind = true;
            ++i;
        } else if (arg == "--no-gravity") {
            ctx.no_gravity = true;
            ++i;
        } else if (arg == "--constraints") {
            ctx.with_constraints = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Geometry and simulation settings as stored in a config file
struct ClothSettings {
    ClothGeometry geometry;
    ClothConfig config;
};

// Defaults when no path is given; otherwise reads a "cloth_config" file
ClothSettings load_settings(const std::optional<std::string>& config_path);

int command_simulate(int argc, char** argv);
int command_obj(int argc, char** argv);
int command_config(int argc, char** argv);
int command_view(int argc, char** argv);

}  // namespace drape::cli

#endif // DRAPE_CLI_COMMON_HPP
