#include "bike_loader.hpp"
#include <serialization/bicycle_json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>

namespace bikefit {

LoadedBike bike_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("bicycle")) {
        throw DomainError("missing field: bicycle");
    }

    const auto& bicycle = j.at("bicycle");
    LoadedBike bike;
    bike.spec = bicycle.get<BicycleSpec>();

    if (bicycle.contains("color_str")) {
        bike.color = detail::require_string(bicycle, "bicycle", "color_str");
    }
    if (j.contains("rider")) {
        bike.rider = j.at("rider").get<RiderSpec>();
    }
    return bike;
}

LoadedBike load_bike_file(const std::string& path) {
    auto log = logging::get_logger();
    log->debug("Loading bike file: {}", path);

    nlohmann::json j = json::read_json_file(path);
    LoadedBike bike = bike_from_json(j);
    bike.source_file = path;

    log->debug("Loaded '{}' ({}) from {}", bike.spec.name, bike.spec.frame_size, path);
    return bike;
}

LoadedBike default_bike() {
    LoadedBike bike;
    bike.spec = BicycleSpec::example();
    return bike;
}

LoadedBike load_bike_or_default(const std::string& path) {
    try {
        return load_bike_file(path);
    } catch (const LoaderError& e) {
        logging::get_logger()->warn("{}; using example bike", e.what());
    } catch (const DomainError& e) {
        logging::get_logger()->warn("{} in {}; using example bike", e.what(), path);
    }

    LoadedBike bike = default_bike();
    bike.source_file = path;
    bike.is_fallback = true;
    return bike;
}

}  // namespace bikefit
