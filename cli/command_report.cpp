#include "cli_common.hpp"
#include <frame/layout_builder.hpp>
#include <report/spec_report.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>

namespace bikefit::cli {

int command_report(int argc, char** argv) {
    auto log = bikefit::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            std::cerr << "Usage: bikefit report [-j <bike.json>]...\n";
            return 0;
        }

        std::vector<RequestedBike> bikes = load_requested_bikes(ctx);
        SpecReport report(std::cout);
        int failures = 0;

        for (const auto& requested : bikes) {
            try {
                FrameLayout layout = compute_layout(requested.bike.spec, requested.bike.rider);
                report.render(layout, requested.style);
            } catch (const DomainError& e) {
                log->error("Cannot lay out '{}': {}", requested.style.label, e.what());
                std::cerr << "Error: " << requested.style.label << ": " << e.what() << "\n";
                ++failures;
            }
        }

        log->info("Reported {} of {} bikes", bikes.size() - failures, bikes.size());
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikefit::cli
