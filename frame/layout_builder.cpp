#include "layout_builder.hpp"
#include <math/projection.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <cstddef>
#include <exception>
#include <sstream>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace bikefit {

namespace {

// Below this the steering axis is parallel to the hub line
constexpr double MIN_AXIS_COSINE = 1e-12;

void require_finite(const char* what, const Segment2& segment) {
    if (!segment.is_finite()) {
        throw DomainError(std::string(what) + " has no finite coordinates");
    }
}

void require_finite(const char* what, const Point2& point) {
    if (!point.is_finite()) {
        throw DomainError(std::string(what) + " has no finite coordinates");
    }
}

}  // namespace

LayoutContext LayoutContext::create(const BicycleSpec& spec) {
    return LayoutContext{spec, spec.wheel_radius()};
}

Point2 derive_bottom_bracket(const LayoutContext& ctx) {
    return {0.0, ctx.hub_height - ctx.spec.bb_drop};
}

Point2 derive_rear_hub(const LayoutContext& ctx) {
    double chainstay = ctx.spec.chainstay_length;
    double drop = ctx.spec.bb_drop;
    // chainstay^2 - drop^2 factored so large lengths do not overflow
    double difference = chainstay - drop;
    double sum = chainstay + drop;

    if (difference < 0.0 || sum < 0.0) {
        std::ostringstream msg;
        msg << "chainstay too short for bottom-bracket drop (chainstay_length="
            << chainstay << ", bb_drop=" << drop << ")";
        throw DomainError(msg.str());
    }

    Point2 rear_hub{-(std::sqrt(difference) * std::sqrt(sum)), ctx.hub_height};
    require_finite("rear hub", rear_hub);
    return rear_hub;
}

Point2 derive_front_hub(const LayoutContext& ctx, const Point2& rear_hub) {
    return {rear_hub.x + ctx.spec.wheelbase, rear_hub.y};
}

double head_tube_axis_offset(double fork_offset, double head_tube_angle) {
    double divisor = std::cos(degrees_to_radians(90.0 - head_tube_angle));
    if (std::abs(divisor) < MIN_AXIS_COSINE) {
        std::ostringstream msg;
        msg << "head tube angle " << head_tube_angle
            << " puts the steering axis parallel to the hub line";
        throw DomainError(msg.str());
    }
    return fork_offset / divisor;
}

Segment2 derive_head_tube(const LayoutContext& ctx, const Point2& front_hub) {
    double x_offset = head_tube_axis_offset(ctx.spec.fork_offset, ctx.spec.head_tube_angle);

    // Where the steering axis crosses the hub line
    Point2 axis_origin{front_hub.x - x_offset, front_hub.y};

    Point2 bottom = vector_endpoint(axis_origin, ctx.spec.fork_length, ctx.spec.head_tube_angle);
    Point2 top = vector_endpoint(bottom, ctx.spec.head_tube_length, ctx.spec.head_tube_angle);
    return {bottom, top};
}

Segment2 derive_seat_tube(const LayoutContext& ctx, const Point2& bottom_bracket) {
    return vector_segment(bottom_bracket, ctx.spec.seat_tube_length, ctx.spec.seat_tube_angle);
}

std::optional<Segment2> derive_stem(const LayoutContext& ctx, const Segment2& head_tube) {
    if (!ctx.spec.has_stem()) {
        return std::nullopt;
    }

    double head_angle = ctx.spec.head_tube_angle;
    Point2 steerer_top = vector_endpoint(head_tube.end, STEERER_EXTENSION, head_angle);

    // Stem angle is measured from the perpendicular of the steerer
    double stem_direction = head_angle - *ctx.spec.stem_angle + 90.0;
    Point2 handlebar = vector_endpoint(steerer_top,
                                       *ctx.spec.stem_length + HANDLEBAR_RADIUS,
                                       stem_direction);
    return Segment2{steerer_top, handlebar};
}

Segment2 derive_saddle(const LayoutContext& ctx,
                       const RiderSpec& rider,
                       const Point2& bottom_bracket) {
    Point2 saddle_top = vector_endpoint(bottom_bracket, rider.saddle_height,
                                        ctx.spec.seat_tube_angle);
    double half_length = rider.saddle_length / 2.0;

    Point2 rear_rail{saddle_top.x - half_length - rider.saddle_set_back, saddle_top.y};
    Point2 front_rail{saddle_top.x + half_length - rider.saddle_set_back, saddle_top.y};
    return {rear_rail, front_rail};
}

FrameLayout compute_layout(const BicycleSpec& spec, const std::optional<RiderSpec>& rider) {
    auto log = logging::get_logger();
    log->debug("Computing layout for '{}' ({})", spec.name, spec.frame_size);

    validate(spec);
    if (rider) {
        validate(*rider);
    }

    LayoutContext ctx = LayoutContext::create(spec);
    FrameLayout layout;
    layout.spec = spec;
    layout.rider = rider;

    // 1-3: anchors
    Point2 bb = derive_bottom_bracket(ctx);
    Point2 rear_hub = derive_rear_hub(ctx);
    Point2 front_hub = derive_front_hub(ctx, rear_hub);
    require_finite("front hub", front_hub);
    log->trace("bb=({}, {}) rear_hub=({}, {}) front_hub=({}, {})",
               bb.x, bb.y, rear_hub.x, rear_hub.y, front_hub.x, front_hub.y);

    layout.bottom_bracket = BottomBracket{bb, spec.bb_diameter};
    layout.rear_wheel = Wheel{rear_hub, spec.wheel_diameter};
    layout.front_wheel = Wheel{front_hub, spec.wheel_diameter};

    // 4-5: head and seat tubes
    layout.head_tube = derive_head_tube(ctx, front_hub);
    require_finite("head tube", layout.head_tube);
    layout.seat_tube = derive_seat_tube(ctx, bb);
    require_finite("seat tube", layout.seat_tube);
    log->trace("head_tube top=({}, {}) seat_tube top=({}, {})",
               layout.head_tube.end.x, layout.head_tube.end.y,
               layout.seat_tube.end.x, layout.seat_tube.end.y);

    // 6: lines between derived points
    layout.chainstay = Segment2{bb, rear_hub};
    layout.fork = Segment2{front_hub, layout.head_tube.start};
    layout.seat_stay = Segment2{layout.seat_tube.end, rear_hub};
    layout.top_tube = Segment2{layout.head_tube.end, layout.seat_tube.end};
    layout.down_tube = Segment2{layout.head_tube.start, bb};

    layout.stem = derive_stem(ctx, layout.head_tube);
    if (layout.stem) {
        require_finite("stem", *layout.stem);
    }
    if (rider) {
        layout.saddle = derive_saddle(ctx, *rider, bb);
        require_finite("saddle", *layout.saddle);
    }

    // 7: derived lengths
    layout.top_tube_length = distance(layout.head_tube.end, layout.seat_tube.end);
    layout.down_tube_length = distance(layout.head_tube.start, bb);
    if (!std::isfinite(layout.top_tube_length) || !std::isfinite(layout.down_tube_length)) {
        throw DomainError("derived tube lengths are not finite");
    }

    log->debug("Layout '{}': top tube {:.2f}, down tube {:.2f}",
               spec.name, layout.top_tube_length, layout.down_tube_length);
    return layout;
}

std::vector<LayoutOutcome> compute_layouts(const std::vector<LayoutRequest>& requests) {
    std::vector<LayoutOutcome> outcomes(requests.size());

    // Requests share no state; each iteration writes only its own slot
    #pragma omp parallel for schedule(dynamic) if(requests.size() > 8)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(requests.size()); ++i) {
        const auto& request = requests[i];
        try {
            outcomes[i].layout = compute_layout(request.spec, request.rider);
        } catch (const std::exception& e) {
            // Nothing may escape the parallel region
            outcomes[i].error = e.what();
        }
    }

    auto log = logging::get_logger();
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].ok()) {
            log->warn("Layout for '{}' failed: {}", requests[i].spec.name, outcomes[i].error);
        }
    }

    return outcomes;
}

}  // namespace bikefit
