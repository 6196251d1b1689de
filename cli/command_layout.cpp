#include "cli_common.hpp"
#include <frame/layout_builder.hpp>
#include <report/spec_report.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/bicycle_json.hpp>
#include <common/logging.hpp>

namespace bikefit::cli {

int command_layout(int argc, char** argv) {
    auto log = bikefit::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_paths.size() != 1) {
            std::cerr << "Usage: bikefit layout <bike.json> [-o <layout.json>]\n";
            return ctx.help ? 0 : 1;
        }

        const std::string& input = ctx.input_paths.front();
        log->info("Computing layout from: {}", input);

        // Load failures are fatal here: no example-bike fallback for an export
        LoadedBike bike = load_bike_file(input);
        FrameLayout layout = compute_layout(bike.spec, bike.rider);

        LayoutJsonWriter writer;
        writer.render(layout, DisplayStyle{bike.color.value_or(display_color(0)),
                                           bike.spec.name + " " + bike.spec.frame_size});

        json::SerializedData data;
        data.step = "frame_layout";
        data.timestamp = json::get_timestamp();
        data.source_file = input;
        data.config = {{"bicycle", bike.spec}};
        if (bike.rider) {
            data.config["rider"] = *bike.rider;
        }
        data.data = writer.layouts().front();
        data.stats = {
            {"top_tube_length", layout.top_tube_length},
            {"down_tube_length", layout.down_tube_length}
        };

        if (ctx.output_path.empty()) {
            std::cout << data.to_json().dump(2) << "\n";
        } else {
            json::write_serialized(ctx.output_path, data);
            log->info("Wrote layout to {}", ctx.output_path);
            std::cerr << "Wrote " << ctx.output_path << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikefit::cli
