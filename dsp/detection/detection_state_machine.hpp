#pragma once

#include <cstdint>

namespace peckwatch::dsp {

enum class DetectionState { Idle, Cooldown };

struct DetectionEvent {
    uint64_t session_id = 0;
    uint64_t window_index = 0;   // 1-based, per session
    double timestamp = 0.0;      // seconds, caller's clock
    float confidence = 0.0f;     // clamped to [0, 1]
    bool triggered = false;
    bool suppressed = false;     // at/above threshold but inside the cooldown
};

// DetectionStateMachine converts one session's confidence stream into
// DetectionEvents. The cooldown is a lazy timestamp comparison made on
// each window; there is no timer. Both the threshold and the cooldown
// boundary are inclusive.
class DetectionStateMachine {
public:
    DetectionStateMachine(float threshold, double cooldown_seconds, uint64_t session_id = 0);

    DetectionEvent on_window(float confidence, double now_seconds);

    DetectionState state() const { return state_; }
    double last_trigger_time() const { return last_trigger_; }
    uint64_t windows_seen() const { return window_index_; }
    float threshold() const { return threshold_; }
    double cooldown_seconds() const { return cooldown_; }

    // Seconds until IDLE at `now_seconds`, 0 when already idle.
    double cooldown_remaining(double now_seconds) const;

    void reset();

private:
    float threshold_;
    double cooldown_;
    uint64_t session_id_;
    DetectionState state_ = DetectionState::Idle;
    double last_trigger_ = 0.0;
    uint64_t window_index_ = 0;
};

} // namespace peckwatch::dsp
