#ifndef BIKEFIT_REPORT_LAYOUT_RENDERER_HPP
#define BIKEFIT_REPORT_LAYOUT_RENDERER_HPP

#include <frame/frame_layout.hpp>
#include <string>

namespace bikefit {

// Caller-assigned presentation for one layout
struct DisplayStyle {
    std::string color;
    std::string label;
};

// Consumer of computed layouts. Renderers only read the layout; any output
// target is handed to the renderer explicitly at construction.
class LayoutRenderer {
public:
    virtual ~LayoutRenderer() = default;

    virtual void render(const FrameLayout& layout, const DisplayStyle& style) = 0;
};

}  // namespace bikefit

#endif // BIKEFIT_REPORT_LAYOUT_RENDERER_HPP
