#include "cli_common.hpp"
#include <frame/layout_builder.hpp>
#include <frame/frame_summary.hpp>
#include <report/spec_report.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/frame_layout_json.hpp>
#include <common/logging.hpp>

namespace bikefit::cli {

int command_compare(int argc, char** argv) {
    auto log = bikefit::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            std::cerr << "Usage: bikefit compare -j <a.json> -j <b.json> ... [-o <table.json>]\n";
            return 0;
        }

        std::vector<RequestedBike> bikes = load_requested_bikes(ctx);

        std::vector<LayoutRequest> requests;
        for (const auto& requested : bikes) {
            requests.push_back({requested.bike.spec, requested.bike.rider});
        }

        // Failed layouts are reported by compute_layouts and left out of the table
        std::vector<FrameLayout> layouts;
        for (auto& outcome : compute_layouts(requests)) {
            if (outcome.ok()) {
                layouts.push_back(std::move(*outcome.layout));
            } else {
                std::cerr << "Error: " << outcome.error << "\n";
            }
        }

        if (layouts.empty()) {
            log->error("No bike could be laid out");
            return 1;
        }

        ComparisonTable table = summarize(layouts);
        write_comparison(std::cout, table);

        if (!ctx.output_path.empty()) {
            json::SerializedData data;
            data.step = "comparison";
            data.timestamp = json::get_timestamp();
            data.data = table;
            data.stats = {
                {"requested", requests.size()},
                {"compared", layouts.size()}
            };
            json::write_serialized(ctx.output_path, data);
            log->info("Wrote comparison to {}", ctx.output_path);
        }

        return layouts.size() == requests.size() ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikefit::cli
