#ifndef BIKEFIT_REPORT_DISPLAY_COLOR_HPP
#define BIKEFIT_REPORT_DISPLAY_COLOR_HPP

#include <array>
#include <cstddef>
#include <string>

namespace bikefit {

// Single-letter color codes, cycled when more bicycles than colors are shown
inline std::string display_color(size_t n) {
    static constexpr std::array<const char*, 8> colors = {
        "b",  // blue
        "g",  // green
        "r",  // red
        "c",  // cyan
        "m",  // magenta
        "y",  // yellow
        "k",  // black
        "w",  // white
    };
    return colors[n % colors.size()];
}

}  // namespace bikefit

#endif // BIKEFIT_REPORT_DISPLAY_COLOR_HPP
