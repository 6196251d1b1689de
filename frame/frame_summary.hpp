#ifndef BIKEFIT_FRAME_FRAME_SUMMARY_HPP
#define BIKEFIT_FRAME_FRAME_SUMMARY_HPP

#include "frame_layout.hpp"
#include <string>
#include <vector>

namespace bikefit {

// One named measurement across every compared bicycle
struct MeasurementRow {
    std::string label;
    std::string unit;                  // "mm" or "deg"
    std::vector<double> values;        // One per column
};

// Side-by-side measurements, one column per bicycle
struct ComparisonTable {
    std::vector<std::string> columns;  // "<name> <size>"
    std::vector<MeasurementRow> rows;

    const MeasurementRow* find_row(const std::string& label) const;
};

// Project already-computed layouts into a comparison table.
// Throws std::invalid_argument when no layouts are given.
ComparisonTable summarize(const std::vector<FrameLayout>& layouts);

}  // namespace bikefit

#endif // BIKEFIT_FRAME_FRAME_SUMMARY_HPP
