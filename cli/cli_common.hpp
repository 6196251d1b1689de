#ifndef BIKEFIT_CLI_COMMON_HPP
#define BIKEFIT_CLI_COMMON_HPP

#include <loader/bike_loader.hpp>
#include <report/display_color.hpp>
#include <report/layout_renderer.hpp>
#include <common/logging.hpp>
#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace bikefit::cli {

// Common context for all CLI commands
struct CommandContext {
    std::vector<std::string> input_paths;
    std::string output_path;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-j" || arg == "--json") {
            if (i + 1 < argc) {
                ctx.input_paths.push_back(argv[++i]);
                ++i;
            } else {
                throw std::runtime_error("-j/--json requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (bike file)
            ctx.input_paths.push_back(arg);
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// A bike ready to be laid out and shown
struct RequestedBike {
    LoadedBike bike;
    DisplayStyle style;
};

// Load every requested bike file, falling back to the example bike for files
// that cannot be loaded. With no files, the example bike alone is returned.
inline std::vector<RequestedBike> load_requested_bikes(const CommandContext& ctx) {
    std::vector<LoadedBike> bikes;
    if (ctx.input_paths.empty()) {
        bikes.push_back(default_bike());
    } else {
        for (const auto& path : ctx.input_paths) {
            bikes.push_back(load_bike_or_default(path));
        }
    }

    std::vector<RequestedBike> requested;
    for (size_t i = 0; i < bikes.size(); ++i) {
        RequestedBike r{bikes[i], {}};
        r.style.color = bikes[i].color.value_or(display_color(i));
        r.style.label = bikes[i].spec.name + " " + bikes[i].spec.frame_size;
        requested.push_back(std::move(r));
    }
    return requested;
}

// Command function declarations
int command_layout(int argc, char** argv);
int command_report(int argc, char** argv);
int command_compare(int argc, char** argv);

}  // namespace bikefit::cli

#endif // BIKEFIT_CLI_COMMON_HPP
