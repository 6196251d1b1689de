#include "frame_summary.hpp"
#include <functional>
#include <stdexcept>
#include <utility>

namespace bikefit {

namespace {

struct RowDefinition {
    const char* label;
    const char* unit;
    std::function<double(const FrameLayout&)> value;
};

const std::vector<RowDefinition>& row_definitions() {
    static const std::vector<RowDefinition> rows = {
        {"wheelbase", "mm", [](const FrameLayout& l) { return l.wheelbase(); }},
        {"top tube", "mm", [](const FrameLayout& l) { return l.top_tube_length; }},
        {"down tube", "mm", [](const FrameLayout& l) { return l.down_tube_length; }},
        {"head angle", "deg", [](const FrameLayout& l) { return l.spec.head_tube_angle; }},
        {"seat angle", "deg", [](const FrameLayout& l) { return l.spec.seat_tube_angle; }},
        {"chainstay", "mm", [](const FrameLayout& l) { return l.spec.chainstay_length; }},
        {"stack", "mm", [](const FrameLayout& l) { return l.stack(); }},
        {"reach", "mm", [](const FrameLayout& l) { return l.reach(); }},
    };
    return rows;
}

}  // namespace

const MeasurementRow* ComparisonTable::find_row(const std::string& label) const {
    for (const auto& row : rows) {
        if (row.label == label) {
            return &row;
        }
    }
    return nullptr;
}

ComparisonTable summarize(const std::vector<FrameLayout>& layouts) {
    if (layouts.empty()) {
        throw std::invalid_argument("summarize: at least one layout is required");
    }

    ComparisonTable table;
    for (const auto& layout : layouts) {
        table.columns.push_back(layout.spec.name + " " + layout.spec.frame_size);
    }

    for (const auto& def : row_definitions()) {
        MeasurementRow row{def.label, def.unit, {}};
        row.values.reserve(layouts.size());
        for (const auto& layout : layouts) {
            row.values.push_back(def.value(layout));
        }
        table.rows.push_back(std::move(row));
    }

    return table;
}

}  // namespace bikefit
