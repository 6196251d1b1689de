#ifndef BIKEFIT_FRAME_FRAME_LAYOUT_HPP
#define BIKEFIT_FRAME_FRAME_LAYOUT_HPP

#include <math/vec2.hpp>
#include <bicycle/bicycle_spec.hpp>
#include <optional>
#include <string_view>

namespace bikefit {

// Wheel placed at its hub
struct Wheel {
    Point2 hub;
    double diameter = 0.0;

    bool operator==(const Wheel& other) const = default;
};

// Bottom bracket shell placed at its center
struct BottomBracket {
    Point2 center;
    double diameter = 0.0;

    bool operator==(const BottomBracket& other) const = default;
};

// Complete 2D layout of one bicycle.
//
// Coordinates: y = 0 is the ground line, both hubs sit at the wheel radius
// and the bottom bracket center sits at x = 0.
struct FrameLayout {
    BicycleSpec spec;                  // Input the layout was derived from
    std::optional<RiderSpec> rider;

    BottomBracket bottom_bracket;
    Wheel rear_wheel;
    Wheel front_wheel;

    Segment2 head_tube;                // start = bottom, end = top
    Segment2 seat_tube;                // start = bottom bracket, end = top
    Segment2 chainstay;                // bottom bracket -> rear hub
    Segment2 fork;                     // front hub -> head tube bottom
    Segment2 seat_stay;                // seat tube top -> rear hub
    Segment2 top_tube;                 // head tube top -> seat tube top
    Segment2 down_tube;                // head tube bottom -> bottom bracket

    std::optional<Segment2> stem;      // steerer top -> handlebar clamp
    std::optional<Segment2> saddle;    // rear rail end -> front rail end

    double top_tube_length = 0.0;
    double down_tube_length = 0.0;

    const Point2& rear_hub() const { return rear_wheel.hub; }
    const Point2& front_hub() const { return front_wheel.hub; }

    double wheel_diameter() const { return front_wheel.diameter; }

    double wheelbase() const { return front_hub().x - rear_hub().x; }

    // Head tube top relative to the bottom bracket
    double stack() const { return head_tube.end.y - bottom_bracket.center.y; }
    double reach() const { return head_tube.end.x - bottom_bracket.center.x; }

    // Visit every structural line once, in drawing order.
    // fn(std::string_view name, const Segment2& segment)
    template <typename Fn>
    void for_each_segment(Fn&& fn) const {
        fn(std::string_view("chainstay"), chainstay);
        fn(std::string_view("fork"), fork);
        fn(std::string_view("head_tube"), head_tube);
        fn(std::string_view("seat_stay"), seat_stay);
        fn(std::string_view("seat_tube"), seat_tube);
        fn(std::string_view("top_tube"), top_tube);
        fn(std::string_view("down_tube"), down_tube);
        if (stem) {
            fn(std::string_view("stem"), *stem);
        }
        if (saddle) {
            fn(std::string_view("saddle"), *saddle);
        }
    }

    bool operator==(const FrameLayout& other) const = default;
};

}  // namespace bikefit

#endif // BIKEFIT_FRAME_FRAME_LAYOUT_HPP
