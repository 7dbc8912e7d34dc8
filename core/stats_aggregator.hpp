#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "detection/detection_state_machine.hpp"
#include "ring_buffer.hpp"
#include "sound_catalog.hpp"

namespace peckwatch {

// One point of the dashboard's confidence history
struct ConfidenceSample {
    uint64_t window = 0;
    double timestamp = 0.0;
    float confidence = 0.0f;
    bool triggered = false;
};

struct SessionSnapshot {
    uint64_t id = 0;
    ReactionMode mode = ReactionMode::Predators;
    uint64_t chunks = 0;
    uint64_t windows = 0;
    uint64_t detections = 0;   // windows at/above threshold, suppressed ones included
    uint64_t triggers = 0;
    uint64_t sounds_played = 0;
    float last_confidence = 0.0f;
    std::string last_category; // empty until something played
    double opened_at = 0.0;
};

struct TotalsSnapshot {
    uint64_t active_sessions = 0;
    uint64_t sessions_opened = 0;
    uint64_t chunks = 0;
    uint64_t windows = 0;
    uint64_t detections = 0;
    uint64_t triggers = 0;
    uint64_t sounds_played = 0;
};

// Process-wide counters, shared by every SessionStats
struct StatsTotals {
    std::atomic<uint64_t> sessions_opened{0};
    std::atomic<uint64_t> chunks{0};
    std::atomic<uint64_t> windows{0};
    std::atomic<uint64_t> detections{0};
    std::atomic<uint64_t> triggers{0};
    std::atomic<uint64_t> sounds_played{0};
};

// Counters of one session. Written only from the session's own thread,
// read from anywhere; every field is atomic so readers never block it.
class SessionStats {
public:
    static constexpr size_t kFeedSize = 256;

    SessionStats(uint64_t id, ReactionMode mode, double opened_at, StatsTotals& totals);

    uint64_t id() const { return id_; }

    void record_chunk();
    void record_window(const dsp::DetectionEvent& event);
    void record_play(const std::string& category);
    void set_mode(ReactionMode mode) { mode_.store(mode, std::memory_order_relaxed); }
    ReactionMode mode() const { return mode_.load(std::memory_order_relaxed); }

    SessionSnapshot snapshot() const;

    // Recent confidences for the dashboard (single consumer)
    RingBuffer<ConfidenceSample>& feed() { return feed_; }

private:
    const uint64_t id_;
    const double opened_at_;
    StatsTotals& totals_;

    std::atomic<ReactionMode> mode_;
    std::atomic<uint64_t> chunks_{0};
    std::atomic<uint64_t> windows_{0};
    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> triggers_{0};
    std::atomic<uint64_t> sounds_played_{0};
    std::atomic<float> last_confidence_{0.0f};
    // Accessed only through std::atomic_load / std::atomic_store
    std::shared_ptr<const std::string> last_category_;

    RingBuffer<ConfidenceSample> feed_;
};

// Registry of live sessions plus totals that survive session close.
class StatsAggregator {
public:
    StatsAggregator() = default;
    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    std::shared_ptr<SessionStats> open_session(ReactionMode mode, double now);
    void close_session(uint64_t id);

    TotalsSnapshot totals() const;
    std::vector<SessionSnapshot> sessions() const;

    // Live stats objects, ordered by id; used by the dashboard to drain feeds
    std::vector<std::shared_ptr<SessionStats>> live_sessions() const;

private:
    StatsTotals totals_;
    std::atomic<uint64_t> next_id_{1};
    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<SessionStats>> live_;
};

} // namespace peckwatch
