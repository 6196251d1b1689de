#ifndef BIKEFIT_SERIALIZATION_FRAME_LAYOUT_JSON_HPP
#define BIKEFIT_SERIALIZATION_FRAME_LAYOUT_JSON_HPP

#include <nlohmann/json.hpp>
#include <frame/frame_layout.hpp>
#include <frame/frame_summary.hpp>
#include <math/vec2.hpp>
#include <string>

namespace bikefit {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

// Segment2 serialization, as parallel coordinate arrays
inline void to_json(nlohmann::json& j, const Segment2& segment) {
    j = {
        {"x", segment.xs()},
        {"y", segment.ys()}
    };
}

inline void to_json(nlohmann::json& j, const Wheel& wheel) {
    j = {
        {"hub", wheel.hub},
        {"diameter", wheel.diameter}
    };
}

inline void to_json(nlohmann::json& j, const BottomBracket& bb) {
    j = {
        {"center", bb.center},
        {"diameter", bb.diameter}
    };
}

// FrameLayout serialization
inline nlohmann::json frame_layout_to_json(const FrameLayout& layout) {
    nlohmann::json j;
    j["name"] = layout.spec.name;
    j["size"] = layout.spec.frame_size;
    j["bottom_bracket"] = layout.bottom_bracket;
    j["rear_wheel"] = layout.rear_wheel;
    j["front_wheel"] = layout.front_wheel;

    nlohmann::json segments = nlohmann::json::object();
    layout.for_each_segment([&segments](std::string_view name, const Segment2& segment) {
        segments[std::string(name)] = segment;
    });
    j["segments"] = segments;

    j["top_tube_length"] = layout.top_tube_length;
    j["down_tube_length"] = layout.down_tube_length;
    j["stack"] = layout.stack();
    j["reach"] = layout.reach();
    return j;
}

// ComparisonTable serialization
inline void to_json(nlohmann::json& j, const ComparisonTable& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : table.rows) {
        rows.push_back({
            {"label", row.label},
            {"unit", row.unit},
            {"values", row.values}
        });
    }
    j = {
        {"columns", table.columns},
        {"rows", rows}
    };
}

}  // namespace bikefit

#endif // BIKEFIT_SERIALIZATION_FRAME_LAYOUT_JSON_HPP
