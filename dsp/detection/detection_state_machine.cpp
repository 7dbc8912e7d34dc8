#include "detection_state_machine.hpp"

#include <algorithm>
#include <cmath>

namespace peckwatch::dsp {

DetectionStateMachine::DetectionStateMachine(float threshold, double cooldown_seconds, uint64_t session_id)
    : threshold_(std::clamp(threshold, 0.0f, 1.0f)),
      cooldown_(std::max(0.0, cooldown_seconds)),
      session_id_(session_id) {}

DetectionEvent DetectionStateMachine::on_window(float confidence, double now_seconds) {
    if (!std::isfinite(confidence)) confidence = 0.0f;
    confidence = std::clamp(confidence, 0.0f, 1.0f);

    if (state_ == DetectionState::Cooldown && now_seconds - last_trigger_ >= cooldown_) {
        state_ = DetectionState::Idle;
    }

    DetectionEvent ev;
    ev.session_id = session_id_;
    ev.window_index = ++window_index_;
    ev.timestamp = now_seconds;
    ev.confidence = confidence;

    if (confidence >= threshold_) {
        if (state_ == DetectionState::Idle) {
            ev.triggered = true;
            state_ = DetectionState::Cooldown;
            last_trigger_ = now_seconds;
        } else {
            ev.suppressed = true;
        }
    }
    return ev;
}

double DetectionStateMachine::cooldown_remaining(double now_seconds) const {
    if (state_ != DetectionState::Cooldown) return 0.0;
    return std::max(0.0, cooldown_ - (now_seconds - last_trigger_));
}

void DetectionStateMachine::reset() {
    state_ = DetectionState::Idle;
    last_trigger_ = 0.0;
    window_index_ = 0;
}

} // namespace peckwatch::dsp
