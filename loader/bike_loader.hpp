#ifndef BIKEFIT_LOADER_BIKE_LOADER_HPP
#define BIKEFIT_LOADER_BIKE_LOADER_HPP

#include <nlohmann/json.hpp>
#include <bicycle/bicycle_spec.hpp>
#include <optional>
#include <string>

namespace bikefit {

// A bicycle read from a bike file, with its optional rider and display color
struct LoadedBike {
    BicycleSpec spec;
    std::optional<RiderSpec> rider;
    std::optional<std::string> color;  // "color_str" from the file, if any
    std::string source_file;           // Empty for the built-in example
    bool is_fallback = false;          // True when the example replaced a bad file
};

// Parse a {"bicycle": {...}, "rider": {...}} document.
// Missing or non-numeric fields raise DomainError.
LoadedBike bike_from_json(const nlohmann::json& j);

// Read and parse a bike file.
// Throws LoaderError for unreadable/malformed files, DomainError for bad fields.
LoadedBike load_bike_file(const std::string& path);

// Built-in example bicycle
LoadedBike default_bike();

// Load a bike file, substituting the example bicycle on any load failure
LoadedBike load_bike_or_default(const std::string& path);

}  // namespace bikefit

#endif // BIKEFIT_LOADER_BIKE_LOADER_HPP
