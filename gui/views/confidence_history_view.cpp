#include "confidence_history_view.hpp"

#include <algorithm>
#include <cstdio>

namespace gui {

void ConfidenceHistoryView::draw(ImDrawList* dl,
                                 const ImVec2& canvas_pos,
                                 float width,
                                 float height,
                                 const std::deque<peckwatch::ConfidenceSample>& history,
                                 float threshold) const {
    if (!dl || width <= 0 || height <= 0) return;

    const ImVec2 p0 = canvas_pos;
    const ImVec2 p1 = ImVec2(canvas_pos.x + width, canvas_pos.y + height);
    dl->AddRectFilled(p0, p1, IM_COL32(20,20,22,255));
    dl->AddRect(p0, p1, IM_COL32(60,60,60,255));

    auto y_of = [&](float v) {
        v = std::clamp(v, 0.0f, 1.0f);
        return canvas_pos.y + (1.0f - v) * height;
    };

    // Threshold line
    const float ty = y_of(threshold);
    dl->AddLine(ImVec2(p0.x, ty), ImVec2(p1.x, ty), IM_COL32(255,160,0,180), 1.5f);
    char label[32];
    std::snprintf(label, sizeof(label), "T=%.2f", threshold);
    dl->AddText(ImVec2(p0.x + 4, ty - 14), IM_COL32(255,160,0,220), label);

    const int n = std::min(static_cast<int>(history.size()), std::max(2, max_points));
    if (n < 1) return;
    const int first = static_cast<int>(history.size()) - n;
    const float step = width / static_cast<float>(std::max(1, max_points - 1));
    const float x_end = p1.x;

    ImVec2 prev;
    for (int i = 0; i < n; ++i) {
        const auto& s = history[first + i];
        const ImVec2 pt(x_end - static_cast<float>(n - 1 - i) * step, y_of(s.confidence));
        if (i > 0) dl->AddLine(prev, pt, IM_COL32(0,200,255,255), 2.0f);
        if (show_markers && s.triggered) {
            dl->AddCircleFilled(pt, 4.0f, IM_COL32(255,64,64,255));
        }
        prev = pt;
    }
}

} // namespace gui
