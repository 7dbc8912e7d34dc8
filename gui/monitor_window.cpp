#include "monitor_window.hpp"

#include <cstdio>
#include <set>
#include <vector>

namespace gui {

using namespace peckwatch;

void MonitorWindow::drain_feeds(Engine& engine) {
    std::set<uint64_t> live;
    std::vector<ConfidenceSample> fresh;
    for (const auto& stats : engine.stats().live_sessions()) {
        live.insert(stats->id());
        fresh.clear();
        stats->feed().drain(fresh);
        auto& h = histories_[stats->id()];
        h.insert(h.end(), fresh.begin(), fresh.end());
        while (static_cast<int>(h.size()) > history_view_.max_points) h.pop_front();
    }
    // Forget closed sessions
    for (auto it = histories_.begin(); it != histories_.end();) {
        if (live.count(it->first) == 0) it = histories_.erase(it);
        else ++it;
    }
    if (histories_.count(selected_) == 0) {
        selected_ = histories_.empty() ? 0 : histories_.begin()->first;
    }
}

void MonitorWindow::render_status(const StatusSnapshot& s) {
    if (s.ready) {
        ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.4f, 1.0f), "RUNNING");
    } else {
        ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.3f, 1.0f), "NOT READY");
        for (const auto& p : s.problems) ImGui::BulletText("%s", p.c_str());
    }
    ImGui::SameLine();
    ImGui::Text("  model %s | %zu sounds in %zu categories", s.classifier_loaded ? "loaded" : "missing",
                s.total_assets, s.categories.size());
    ImGui::Text("Threshold %.2f  Cooldown %.1f s  Window %.2f s @ %d Hz", s.threshold, s.cooldown_seconds,
                s.window_seconds, s.sample_rate);

    ImGui::Separator();
    const TotalsSnapshot& t = s.totals;
    ImGui::Text("Sessions: %llu active, %llu opened", (unsigned long long)t.active_sessions,
                (unsigned long long)t.sessions_opened);
    ImGui::Text("Windows %llu  Detections %llu  Triggers %llu  Sounds %llu", (unsigned long long)t.windows,
                (unsigned long long)t.detections, (unsigned long long)t.triggers, (unsigned long long)t.sounds_played);
}

void MonitorWindow::render_sessions(const std::vector<SessionSnapshot>& sessions) {
    if (sessions.empty()) {
        ImGui::TextDisabled("No connected clients");
        return;
    }
    if (ImGui::BeginTable("sessions", 8, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Id");
        ImGui::TableSetupColumn("Mode");
        ImGui::TableSetupColumn("Chunks");
        ImGui::TableSetupColumn("Windows");
        ImGui::TableSetupColumn("Detections");
        ImGui::TableSetupColumn("Sounds");
        ImGui::TableSetupColumn("Confidence");
        ImGui::TableSetupColumn("Last sound");
        ImGui::TableHeadersRow();
        for (const auto& s : sessions) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            char id[32];
            std::snprintf(id, sizeof(id), "%llu", (unsigned long long)s.id);
            if (ImGui::Selectable(id, selected_ == s.id, ImGuiSelectableFlags_SpanAllColumns)) selected_ = s.id;
            ImGui::TableNextColumn(); ImGui::TextUnformatted(reaction_mode_name(s.mode));
            ImGui::TableNextColumn(); ImGui::Text("%llu", (unsigned long long)s.chunks);
            ImGui::TableNextColumn(); ImGui::Text("%llu", (unsigned long long)s.windows);
            ImGui::TableNextColumn(); ImGui::Text("%llu", (unsigned long long)s.detections);
            ImGui::TableNextColumn(); ImGui::Text("%llu", (unsigned long long)s.sounds_played);
            ImGui::TableNextColumn(); ImGui::Text("%.3f", s.last_confidence);
            ImGui::TableNextColumn(); ImGui::TextUnformatted(s.last_category.empty() ? "-" : s.last_category.c_str());
        }
        ImGui::EndTable();
    }
}

void MonitorWindow::render(Engine& engine) {
    drain_feeds(engine);
    const StatusSnapshot status = engine.status().snapshot();

    ImGui::SetNextWindowPos(ImVec2(0, 0));
    ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
    ImGui::Begin("peckwatch", nullptr, ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                           ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar);

    render_status(status);
    ImGui::Separator();
    render_sessions(engine.stats().sessions());

    auto it = histories_.find(selected_);
    if (it != histories_.end()) {
        ImGui::Separator();
        ImGui::Text("Session %llu confidence", (unsigned long long)selected_);
        ImGui::SameLine();
        ImGui::Checkbox("Trigger markers", &history_view_.show_markers);
        ImVec2 avail = ImGui::GetContentRegionAvail();
        float h = avail.y > 120.0f ? avail.y - 8.0f : 120.0f;
        ImVec2 pos = ImGui::GetCursorScreenPos();
        history_view_.draw(ImGui::GetWindowDrawList(), pos, avail.x, h, it->second, status.threshold);
        ImGui::Dummy(ImVec2(avail.x, h));
    }

    ImGui::End();
}

} // namespace gui
