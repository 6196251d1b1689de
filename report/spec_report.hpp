#ifndef BIKEFIT_REPORT_SPEC_REPORT_HPP
#define BIKEFIT_REPORT_SPEC_REPORT_HPP

#include "layout_renderer.hpp"
#include <frame/frame_summary.hpp>
#include <nlohmann/json.hpp>
#include <ostream>

namespace bikefit {

// Plain-text dimensional report, one block per layout
class SpecReport : public LayoutRenderer {
public:
    explicit SpecReport(std::ostream& out) : out_(out) {}

    void render(const FrameLayout& layout, const DisplayStyle& style) override;

private:
    std::ostream& out_;
};

// Collects layouts into a JSON array (one object per layout)
class LayoutJsonWriter : public LayoutRenderer {
public:
    void render(const FrameLayout& layout, const DisplayStyle& style) override;

    const nlohmann::json& layouts() const { return layouts_; }
    size_t size() const { return layouts_.size(); }

private:
    nlohmann::json layouts_ = nlohmann::json::array();
};

// Aligned text table, one column per bicycle
void write_comparison(std::ostream& out, const ComparisonTable& table);

}  // namespace bikefit

#endif // BIKEFIT_REPORT_SPEC_REPORT_HPP
