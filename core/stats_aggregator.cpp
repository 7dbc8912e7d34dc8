#include "stats_aggregator.hpp"

namespace peckwatch {

SessionStats::SessionStats(uint64_t id, ReactionMode mode, double opened_at, StatsTotals& totals)
    : id_(id), opened_at_(opened_at), totals_(totals), mode_(mode), feed_(kFeedSize) {}

void SessionStats::record_chunk() {
    chunks_.fetch_add(1, std::memory_order_relaxed);
    totals_.chunks.fetch_add(1, std::memory_order_relaxed);
}

void SessionStats::record_window(const dsp::DetectionEvent& event) {
    windows_.fetch_add(1, std::memory_order_relaxed);
    totals_.windows.fetch_add(1, std::memory_order_relaxed);
    last_confidence_.store(event.confidence, std::memory_order_relaxed);

    if (event.triggered || event.suppressed) {
        detections_.fetch_add(1, std::memory_order_relaxed);
        totals_.detections.fetch_add(1, std::memory_order_relaxed);
    }
    if (event.triggered) {
        triggers_.fetch_add(1, std::memory_order_relaxed);
        totals_.triggers.fetch_add(1, std::memory_order_relaxed);
    }

    ConfidenceSample sample;
    sample.window = event.window_index;
    sample.timestamp = event.timestamp;
    sample.confidence = event.confidence;
    sample.triggered = event.triggered;
    feed_.push(sample);  // dropped when no dashboard is draining
}

void SessionStats::record_play(const std::string& category) {
    sounds_played_.fetch_add(1, std::memory_order_relaxed);
    totals_.sounds_played.fetch_add(1, std::memory_order_relaxed);
    std::atomic_store(&last_category_, std::make_shared<const std::string>(category));
}

SessionSnapshot SessionStats::snapshot() const {
    SessionSnapshot s;
    s.id = id_;
    s.mode = mode_.load(std::memory_order_relaxed);
    s.chunks = chunks_.load(std::memory_order_relaxed);
    s.windows = windows_.load(std::memory_order_relaxed);
    s.detections = detections_.load(std::memory_order_relaxed);
    s.triggers = triggers_.load(std::memory_order_relaxed);
    s.sounds_played = sounds_played_.load(std::memory_order_relaxed);
    s.last_confidence = last_confidence_.load(std::memory_order_relaxed);
    auto cat = std::atomic_load(&last_category_);
    if (cat) s.last_category = *cat;
    s.opened_at = opened_at_;
    return s;
}

std::shared_ptr<SessionStats> StatsAggregator::open_session(ReactionMode mode, double now) {
    const uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    auto stats = std::make_shared<SessionStats>(id, mode, now, totals_);
    totals_.sessions_opened.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    live_[id] = stats;
    return stats;
}

void StatsAggregator::close_session(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(id);
}

TotalsSnapshot StatsAggregator::totals() const {
    TotalsSnapshot t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        t.active_sessions = live_.size();
    }
    t.sessions_opened = totals_.sessions_opened.load(std::memory_order_relaxed);
    t.chunks = totals_.chunks.load(std::memory_order_relaxed);
    t.windows = totals_.windows.load(std::memory_order_relaxed);
    t.detections = totals_.detections.load(std::memory_order_relaxed);
    t.triggers = totals_.triggers.load(std::memory_order_relaxed);
    t.sounds_played = totals_.sounds_played.load(std::memory_order_relaxed);
    return t;
}

std::vector<SessionSnapshot> StatsAggregator::sessions() const {
    std::vector<SessionSnapshot> out;
    for (const auto& s : live_sessions()) out.push_back(s->snapshot());
    return out;
}

std::vector<std::shared_ptr<SessionStats>> StatsAggregator::live_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SessionStats>> out;
    out.reserve(live_.size());
    for (const auto& kv : live_) out.push_back(kv.second);
    return out;
}

} // namespace peckwatch
