#include "stats_aggregator.hpp"
#include "test_check.hpp"

#include <thread>
#include <vector>

using namespace peckwatch;
using peckwatch::dsp::DetectionEvent;

static DetectionEvent event(uint64_t idx, float conf, bool triggered, bool suppressed) {
    DetectionEvent e;
    e.window_index = idx;
    e.timestamp = static_cast<double>(idx);
    e.confidence = conf;
    e.triggered = triggered;
    e.suppressed = suppressed;
    return e;
}

static void counts_per_session() {
    StatsAggregator agg;
    auto s = agg.open_session(ReactionMode::Predators, 0.0);
    s->record_chunk();
    s->record_chunk();
    s->record_window(event(1, 0.2f, false, false));
    s->record_window(event(2, 0.9f, true, false));
    s->record_window(event(3, 0.95f, false, true));
    s->record_play("predator_owl");

    SessionSnapshot snap = s->snapshot();
    CHECK_EQ(snap.chunks, 2u);
    CHECK_EQ(snap.windows, 3u);
    CHECK_EQ(snap.detections, 2u);
    CHECK_EQ(snap.triggers, 1u);
    CHECK_EQ(snap.sounds_played, 1u);
    CHECK_EQ(snap.last_category, std::string("predator_owl"));
    CHECK_NEAR(snap.last_confidence, 0.95, 1e-6);
}

static void totals_survive_close() {
    StatsAggregator agg;
    auto a = agg.open_session(ReactionMode::Mixed, 0.0);
    auto b = agg.open_session(ReactionMode::Silent, 1.0);
    CHECK(a->id() != b->id());
    a->record_window(event(1, 0.9f, true, false));
    b->record_window(event(1, 0.1f, false, false));
    CHECK_EQ(agg.totals().active_sessions, 2u);

    agg.close_session(a->id());
    TotalsSnapshot t = agg.totals();
    CHECK_EQ(t.active_sessions, 1u);
    CHECK_EQ(t.sessions_opened, 2u);
    CHECK_EQ(t.windows, 2u);
    CHECK_EQ(t.triggers, 1u);
    CHECK_EQ(agg.sessions().size(), 1u);
    CHECK_EQ(agg.sessions()[0].id, b->id());
}

static void mode_change_is_visible() {
    StatsAggregator agg;
    auto s = agg.open_session(ReactionMode::Predators, 0.0);
    s->set_mode(ReactionMode::Woodpeckers);
    CHECK(agg.sessions()[0].mode == ReactionMode::Woodpeckers);
}

static void feed_delivers_recent_windows() {
    StatsAggregator agg;
    auto s = agg.open_session(ReactionMode::Predators, 0.0);
    for (uint64_t i = 1; i <= 5; ++i) s->record_window(event(i, 0.1f * i, i == 4, false));
    std::vector<ConfidenceSample> out;
    CHECK_EQ(s->feed().drain(out), 5u);
    CHECK_EQ(out[3].window, 4u);
    CHECK(out[3].triggered);
    CHECK_EQ(s->feed().drain(out), 0u);

    // Undrained feed drops the newest once full
    for (uint64_t i = 0; i < SessionStats::kFeedSize + 10; ++i) s->record_window(event(i, 0.5f, false, false));
    out.clear();
    CHECK_EQ(s->feed().drain(out), s->feed().capacity());
}

static void concurrent_sessions_do_not_lose_counts() {
    StatsAggregator agg;
    const int threads = 4;
    const int windows = 5000;
    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&agg]() {
            auto s = agg.open_session(ReactionMode::Mixed, 0.0);
            for (int i = 0; i < windows; ++i) {
                s->record_chunk();
                s->record_window(event(i + 1, 0.8f, i % 10 == 0, i % 10 != 0));
            }
            agg.close_session(s->id());
        });
    }
    // Reader running alongside the producers
    for (int i = 0; i < 100; ++i) (void)agg.totals();
    for (auto& th : pool) th.join();

    TotalsSnapshot t = agg.totals();
    CHECK_EQ(t.active_sessions, 0u);
    CHECK_EQ(t.windows, static_cast<uint64_t>(threads * windows));
    CHECK_EQ(t.detections, static_cast<uint64_t>(threads * windows));
    CHECK_EQ(t.triggers, static_cast<uint64_t>(threads * windows / 10));
}

int main() {
    RUN_TEST(counts_per_session);
    RUN_TEST(totals_survive_close);
    RUN_TEST(mode_change_is_visible);
    RUN_TEST(feed_delivers_recent_windows);
    RUN_TEST(concurrent_sessions_do_not_lose_counts);
    return test_check::finish("stats_aggregator_test");
}
