#ifndef BIKEFIT_BICYCLE_BICYCLE_SPEC_HPP
#define BIKEFIT_BICYCLE_BICYCLE_SPEC_HPP

#include <optional>
#include <string>

namespace bikefit {

// Dimensional description of a bicycle frame.
// Lengths are millimeters, angles are degrees from the horizontal.
struct BicycleSpec {
    std::string name = "Example";
    std::string frame_size = "Large";

    // Bottom bracket
    double bb_drop = 75.0;             // Vertical drop below the hub line
    double bb_diameter = 34.8;         // Shell diameter

    // Rear triangle
    double chainstay_length = 450.0;   // BB center to rear axle

    // Front end
    double fork_length = 405.0;        // Axle-to-crown, measured along the steering axis
    double fork_offset = 50.0;         // Rake: axle offset perpendicular to the steering axis
    double head_tube_angle = 71.5;
    double head_tube_length = 205.0;

    // Seat tube
    double seat_tube_angle = 72.5;
    double seat_tube_length = 560.0;   // BB center to top of seat tube

    // Cockpit, laid out only when both are present
    std::optional<double> stem_angle;  // Rise relative to perpendicular of the steerer
    std::optional<double> stem_length;

    double wheelbase = 1072.6;
    double wheel_diameter = 700.0;

    bool has_stem() const {
        return stem_angle.has_value() && stem_length.has_value();
    }

    double wheel_radius() const {
        return wheel_diameter / 2.0;
    }

    bool operator==(const BicycleSpec& other) const = default;

    // Large road frame used whenever no bicycle file is available
    static BicycleSpec example() {
        return BicycleSpec{};
    }
};

// Rider fit on top of a frame
struct RiderSpec {
    double saddle_height = 740.0;      // BB center to saddle top, along the seat tube
    double saddle_length = 270.0;
    double saddle_set_back = 60.0;     // Saddle center behind the seat tube axis

    bool operator==(const RiderSpec& other) const = default;

    static RiderSpec example() {
        return RiderSpec{};
    }
};

// Throw DomainError when a field is non-finite or a length is negative
void validate(const BicycleSpec& spec);
void validate(const RiderSpec& rider);

}  // namespace bikefit

#endif // BIKEFIT_BICYCLE_BICYCLE_SPEC_HPP
