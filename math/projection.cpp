#include "projection.hpp"
#include <cmath>

namespace bikefit {

Point2 vector_endpoint(const Point2& origin, double length, double angle_deg) {
    double direction = std::numbers::pi - degrees_to_radians(angle_deg);
    return origin + Vec2{std::cos(direction), std::sin(direction)} * length;
}

Segment2 vector_segment(const Point2& origin, double length, double angle_deg) {
    return {origin, vector_endpoint(origin, length, angle_deg)};
}

double distance(const Point2& a, const Point2& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

}  // namespace bikefit
