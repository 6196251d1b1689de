#include "spec_report.hpp"
#include <serialization/frame_layout_json.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace bikefit {

namespace {

std::string fixed2(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

void field(std::ostream& out, const char* label, double value) {
    out << "\t" << label << ":\t" << fixed2(value) << "\n";
}

}  // namespace

void SpecReport::render(const FrameLayout& layout, const DisplayStyle& style) {
    const BicycleSpec& spec = layout.spec;

    out_ << "Info:\n";
    out_ << "\tname:\t" << spec.name << "\n";
    out_ << "\tsize:\t" << spec.frame_size << "\n";
    if (!style.color.empty()) {
        out_ << "\tcolor:\t" << style.color << "\n";
    }

    out_ << "Bottom Bracket\n";
    field(out_, "bb diameter", layout.bottom_bracket.diameter);
    field(out_, "bb drop", spec.bb_drop);

    out_ << "Chainstay\n";
    field(out_, "length", spec.chainstay_length);

    out_ << "Fork\n";
    field(out_, "length", spec.fork_length);
    field(out_, "offset", spec.fork_offset);

    out_ << "Head Tube\n";
    field(out_, "angle", spec.head_tube_angle);
    field(out_, "length", spec.head_tube_length);

    out_ << "Seat Tube\n";
    field(out_, "angle", spec.seat_tube_angle);
    field(out_, "length", spec.seat_tube_length);

    out_ << "Top Tube:\n";
    field(out_, "length", layout.top_tube_length);
    out_ << "Down Tube:\n";
    field(out_, "length", layout.down_tube_length);

    out_ << "Wheel\n";
    field(out_, "diameter", layout.wheel_diameter());
    field(out_, "wheelbase", layout.wheelbase());

    if (layout.stem) {
        out_ << "Stem\n";
        field(out_, "angle", *spec.stem_angle);
        field(out_, "length", *spec.stem_length);
    }

    if (layout.saddle && layout.rider) {
        out_ << "Saddle\n";
        field(out_, "height", layout.rider->saddle_height);
        field(out_, "length", layout.rider->saddle_length);
        field(out_, "set back", layout.rider->saddle_set_back);
    }
}

void LayoutJsonWriter::render(const FrameLayout& layout, const DisplayStyle& style) {
    nlohmann::json j = frame_layout_to_json(layout);
    if (!style.color.empty()) j["color"] = style.color;
    if (!style.label.empty()) j["label"] = style.label;
    layouts_.push_back(std::move(j));
}

void write_comparison(std::ostream& out, const ComparisonTable& table) {
    size_t label_width = 0;
    for (const auto& row : table.rows) {
        label_width = std::max(label_width, row.label.size() + row.unit.size() + 3);
    }

    std::vector<size_t> widths;
    for (const auto& column : table.columns) {
        widths.push_back(std::max<size_t>(column.size(), 10));
    }

    out << std::left << std::setw(static_cast<int>(label_width)) << "";
    for (size_t c = 0; c < table.columns.size(); ++c) {
        out << "  " << std::right << std::setw(static_cast<int>(widths[c])) << table.columns[c];
    }
    out << "\n";

    for (const auto& row : table.rows) {
        std::string label = row.label + " (" + row.unit + ")";
        out << std::left << std::setw(static_cast<int>(label_width)) << label;
        for (size_t c = 0; c < row.values.size() && c < widths.size(); ++c) {
            out << "  " << std::right << std::setw(static_cast<int>(widths[c]))
                << fixed2(row.values[c]);
        }
        out << "\n";
    }
}

}  // namespace bikefit
