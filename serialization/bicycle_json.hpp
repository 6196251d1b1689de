#ifndef BIKEFIT_SERIALIZATION_BICYCLE_JSON_HPP
#define BIKEFIT_SERIALIZATION_BICYCLE_JSON_HPP

#include <nlohmann/json.hpp>
#include <bicycle/bicycle_spec.hpp>
#include <common/errors.hpp>
#include <optional>
#include <string>

namespace bikefit {

namespace detail {

inline const nlohmann::json& require_field(const nlohmann::json& j,
                                           const std::string& owner,
                                           const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        throw DomainError("missing field: " + owner + "." + key);
    }
    return j.at(key);
}

inline double require_number(const nlohmann::json& j, const std::string& owner, const char* key) {
    const auto& value = require_field(j, owner, key);
    if (!value.is_number()) {
        throw DomainError("field " + owner + "." + key + " is not a number");
    }
    return value.get<double>();
}

inline std::string require_string(const nlohmann::json& j, const std::string& owner, const char* key) {
    const auto& value = require_field(j, owner, key);
    if (!value.is_string()) {
        throw DomainError("field " + owner + "." + key + " is not a string");
    }
    return value.get<std::string>();
}

inline std::optional<double> optional_number(const nlohmann::json& j,
                                             const std::string& owner,
                                             const char* key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    return require_number(j, owner, key);
}

}  // namespace detail

// BicycleSpec serialization ("size" is the frame size label)
inline void to_json(nlohmann::json& j, const BicycleSpec& spec) {
    j = {
        {"name", spec.name},
        {"size", spec.frame_size},
        {"bb_drop", spec.bb_drop},
        {"bb_diameter", spec.bb_diameter},
        {"chainstay_length", spec.chainstay_length},
        {"fork_length", spec.fork_length},
        {"fork_offset", spec.fork_offset},
        {"head_tube_angle", spec.head_tube_angle},
        {"head_tube_length", spec.head_tube_length},
        {"seat_tube_angle", spec.seat_tube_angle},
        {"seat_tube_length", spec.seat_tube_length},
        {"wheelbase", spec.wheelbase},
        {"wheel_diameter", spec.wheel_diameter}
    };
    if (spec.stem_angle) j["stem_angle"] = *spec.stem_angle;
    if (spec.stem_length) j["stem_length"] = *spec.stem_length;
}

inline void from_json(const nlohmann::json& j, BicycleSpec& spec) {
    const std::string owner = "bicycle";
    spec.name = detail::require_string(j, owner, "name");
    spec.frame_size = detail::require_string(j, owner, "size");
    spec.bb_drop = detail::require_number(j, owner, "bb_drop");
    spec.bb_diameter = detail::require_number(j, owner, "bb_diameter");
    spec.chainstay_length = detail::require_number(j, owner, "chainstay_length");
    spec.fork_length = detail::require_number(j, owner, "fork_length");
    spec.fork_offset = detail::require_number(j, owner, "fork_offset");
    spec.head_tube_angle = detail::require_number(j, owner, "head_tube_angle");
    spec.head_tube_length = detail::require_number(j, owner, "head_tube_length");
    spec.seat_tube_angle = detail::require_number(j, owner, "seat_tube_angle");
    spec.seat_tube_length = detail::require_number(j, owner, "seat_tube_length");
    spec.wheelbase = detail::require_number(j, owner, "wheelbase");
    spec.wheel_diameter = detail::optional_number(j, owner, "wheel_diameter").value_or(700.0);
    spec.stem_angle = detail::optional_number(j, owner, "stem_angle");
    spec.stem_length = detail::optional_number(j, owner, "stem_length");
}

// RiderSpec serialization
inline void to_json(nlohmann::json& j, const RiderSpec& rider) {
    j = {
        {"saddle_height", rider.saddle_height},
        {"saddle_length", rider.saddle_length},
        {"saddle_set_back", rider.saddle_set_back}
    };
}

inline void from_json(const nlohmann::json& j, RiderSpec& rider) {
    const std::string owner = "rider";
    rider.saddle_height = detail::require_number(j, owner, "saddle_height");
    rider.saddle_length = detail::require_number(j, owner, "saddle_length");
    rider.saddle_set_back = detail::require_number(j, owner, "saddle_set_back");
}

}  // namespace bikefit

#endif // BIKEFIT_SERIALIZATION_BICYCLE_JSON_HPP
