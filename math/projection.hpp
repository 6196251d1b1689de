#ifndef BIKEFIT_MATH_PROJECTION_HPP
#define BIKEFIT_MATH_PROJECTION_HPP

#include "vec2.hpp"
#include <numbers>

namespace bikefit {

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

// Endpoint of a vector of the given length projected from origin.
//
// Frame angles are measured from the horizontal with the tube leaning back
// toward the rear wheel, so the direction used is (pi - radians(angle)):
//   angle 0   -> points at -x (toward the rear)
//   angle 90  -> points at +y (straight up)
//   angle 180 -> points at +x (toward the front)
Point2 vector_endpoint(const Point2& origin, double length, double angle_deg);

// Segment from origin to vector_endpoint(origin, length, angle_deg)
Segment2 vector_segment(const Point2& origin, double length, double angle_deg);

// Euclidean distance between two points
double distance(const Point2& a, const Point2& b);

}  // namespace bikefit

#endif // BIKEFIT_MATH_PROJECTION_HPP
