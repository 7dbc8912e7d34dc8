// Rolling confidence plot for one session
#pragma once

#include <imgui.h>
#include <deque>

#include "stats_aggregator.hpp"

namespace gui {

class ConfidenceHistoryView {
public:
    int max_points = 120;   // windows kept on screen
    bool show_markers = true;

    // Newest sample at the right edge; triggered windows get a marker.
    void draw(ImDrawList* dl,
              const ImVec2& canvas_pos,
              float width,
              float height,
              const std::deque<peckwatch::ConfidenceSample>& history,
              float threshold) const;
};

} // namespace gui
