#ifndef BIKEFIT_MATH_VEC2_HPP
#define BIKEFIT_MATH_VEC2_HPP

#include <array>
#include <cmath>

namespace bikefit {

// Frame-plane vector: x grows toward the front wheel, y grows up from the ground
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    double length() const {
        return std::hypot(x, y);
    }

    double distance_to(const Vec2& other) const {
        return (other - *this).length();
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }
};

// Every derived position in a layout is a point in the frame plane
using Point2 = Vec2;

// Straight structural line between two derived points
struct Segment2 {
    Point2 start;
    Point2 end;

    // Parallel-array view: [x1, x2], [y1, y2]
    constexpr std::array<double, 2> xs() const { return {start.x, end.x}; }
    constexpr std::array<double, 2> ys() const { return {start.y, end.y}; }

    double length() const {
        return start.distance_to(end);
    }

    bool is_finite() const {
        return start.is_finite() && end.is_finite();
    }

    constexpr bool operator==(const Segment2& other) const = default;
};

}  // namespace bikefit

#endif // BIKEFIT_MATH_VEC2_HPP
