#pragma once

#include <imgui.h>
#include <deque>
#include <map>

#include "engine.hpp"
#include "views/confidence_history_view.hpp"

namespace gui {

// Dashboard window: engine status, process totals, one row per live
// session and a confidence history for the selected session.
class MonitorWindow {
public:
    void render(peckwatch::Engine& engine);

private:
    ConfidenceHistoryView history_view_;
    std::map<uint64_t, std::deque<peckwatch::ConfidenceSample>> histories_;
    uint64_t selected_ = 0;

    void drain_feeds(peckwatch::Engine& engine);
    void render_status(const peckwatch::StatusSnapshot& status);
    void render_sessions(const std::vector<peckwatch::SessionSnapshot>& sessions);
};

} // namespace gui
