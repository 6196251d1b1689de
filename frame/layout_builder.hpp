#ifndef BIKEFIT_FRAME_LAYOUT_BUILDER_HPP
#define BIKEFIT_FRAME_LAYOUT_BUILDER_HPP

#include "frame_layout.hpp"
#include <bicycle/bicycle_spec.hpp>
#include <math/vec2.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bikefit {

// Steerer length between head tube top and stem clamp (headset cap + spacers)
constexpr double STEERER_EXTENSION = 40.0;

// Handlebar clamp radius for a 31.8 mm bar
constexpr double HANDLEBAR_RADIUS = 15.9;

// Immutable context for layout derivation (doesn't change during a build)
struct LayoutContext {
    const BicycleSpec& spec;
    double hub_height;                 // y of both hubs

    static LayoutContext create(const BicycleSpec& spec);
};

// Main entry point: derive the full layout of one bicycle.
// Throws DomainError when the inputs have no real geometry.
FrameLayout compute_layout(const BicycleSpec& spec,
                           const std::optional<RiderSpec>& rider = std::nullopt);

// One independent layout request for batch computation
struct LayoutRequest {
    BicycleSpec spec;
    std::optional<RiderSpec> rider;
};

// Outcome of one request in a batch: either a layout or the domain error
struct LayoutOutcome {
    std::optional<FrameLayout> layout;
    std::string error;

    bool ok() const { return layout.has_value(); }
};

// Compute independent layouts, in parallel when OpenMP is available.
// Results are in request order; one failing request does not affect others.
std::vector<LayoutOutcome> compute_layouts(const std::vector<LayoutRequest>& requests);

// Derivation steps, in dependency order

Point2 derive_bottom_bracket(const LayoutContext& ctx);

Point2 derive_rear_hub(const LayoutContext& ctx);

Point2 derive_front_hub(const LayoutContext& ctx, const Point2& rear_hub);

// Horizontal distance between the front hub and the point where the
// steering axis crosses the hub line
double head_tube_axis_offset(double fork_offset, double head_tube_angle);

Segment2 derive_head_tube(const LayoutContext& ctx, const Point2& front_hub);

Segment2 derive_seat_tube(const LayoutContext& ctx, const Point2& bottom_bracket);

// Returns nullopt when the bicycle has no stem parameters
std::optional<Segment2> derive_stem(const LayoutContext& ctx, const Segment2& head_tube);

Segment2 derive_saddle(const LayoutContext& ctx,
                       const RiderSpec& rider,
                       const Point2& bottom_bracket);

}  // namespace bikefit

#endif // BIKEFIT_FRAME_LAYOUT_BUILDER_HPP
