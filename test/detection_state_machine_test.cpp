#include "detection/detection_state_machine.hpp"
#include "test_check.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace peckwatch::dsp;

static void scenario_with_cooldown() {
    // 1 s spacing; cooldown long enough that window 5 is still blocked
    DetectionStateMachine dsm(0.75f, 3.5);
    const float conf[] = {0.2f, 0.9f, 0.95f, 0.3f, 0.96f};
    std::vector<DetectionEvent> ev;
    for (int i = 0; i < 5; ++i) ev.push_back(dsm.on_window(conf[i], static_cast<double>(i)));

    CHECK(!ev[0].triggered && !ev[0].suppressed);
    CHECK(ev[1].triggered && !ev[1].suppressed);
    CHECK(!ev[2].triggered && ev[2].suppressed);
    CHECK(!ev[3].triggered && !ev[3].suppressed);
    CHECK(!ev[4].triggered && ev[4].suppressed);

    int detections = 0, triggers = 0;
    for (const auto& e : ev) {
        detections += (e.triggered || e.suppressed) ? 1 : 0;
        triggers += e.triggered ? 1 : 0;
    }
    CHECK_EQ(detections, 3);
    CHECK_EQ(triggers, 1);
    CHECK_EQ(ev[4].window_index, 5u);
}

static void window_at_exact_cooldown_fires() {
    // Default cooldown of 3 s: trigger at t=1, window 5 at t=4 is exactly t+C
    DetectionStateMachine dsm(0.75f, 3.0);
    const float conf[] = {0.2f, 0.9f, 0.95f, 0.3f, 0.96f};
    std::vector<DetectionEvent> ev;
    for (int i = 0; i < 5; ++i) ev.push_back(dsm.on_window(conf[i], static_cast<double>(i)));
    CHECK(ev[1].triggered);
    CHECK(ev[2].suppressed);
    CHECK(ev[4].triggered);
}

static void cooldown_boundary() {
    const double t = 10.0, c = 3.0;
    {
        DetectionStateMachine dsm(0.5f, c);
        CHECK(dsm.on_window(0.9f, t).triggered);
        DetectionEvent e = dsm.on_window(0.9f, t + c - 1e-6);
        CHECK(!e.triggered);
        CHECK(e.suppressed);
        CHECK(dsm.state() == DetectionState::Cooldown);
    }
    {
        DetectionStateMachine dsm(0.5f, c);
        CHECK(dsm.on_window(0.9f, t).triggered);
        CHECK(dsm.on_window(0.9f, t + c).triggered);
        CHECK_NEAR(dsm.last_trigger_time(), t + c, 1e-12);
    }
}

static void threshold_is_inclusive() {
    DetectionStateMachine dsm(0.75f, 3.0);
    CHECK(!dsm.on_window(0.7499f, 0.0).triggered);
    CHECK(dsm.on_window(0.75f, 1.0).triggered);
}

static void below_threshold_never_changes_state() {
    DetectionStateMachine dsm(0.75f, 3.0);
    for (int i = 0; i < 10; ++i) {
        DetectionEvent e = dsm.on_window(0.1f * (i % 7), static_cast<double>(i));
        CHECK(!e.triggered);
        CHECK(!e.suppressed);
        CHECK(dsm.state() == DetectionState::Idle);
    }
    CHECK_EQ(dsm.windows_seen(), 10u);
}

static void confidence_is_sanitized() {
    DetectionStateMachine dsm(0.75f, 0.0);
    DetectionEvent e = dsm.on_window(std::numeric_limits<float>::quiet_NaN(), 0.0);
    CHECK_EQ(e.confidence, 0.0f);
    CHECK(!e.triggered);
    e = dsm.on_window(1.7f, 1.0);
    CHECK_EQ(e.confidence, 1.0f);
    CHECK(e.triggered);
    e = dsm.on_window(-0.2f, 2.0);
    CHECK_EQ(e.confidence, 0.0f);
}

static void zero_cooldown_triggers_every_match() {
    DetectionStateMachine dsm(0.5f, 0.0);
    for (int i = 0; i < 5; ++i) CHECK(dsm.on_window(0.8f, static_cast<double>(i)).triggered);
}

static void cooldown_remaining_and_reset() {
    DetectionStateMachine dsm(0.5f, 3.0, 42);
    CHECK_EQ(dsm.cooldown_remaining(0.0), 0.0);
    DetectionEvent e = dsm.on_window(0.9f, 5.0);
    CHECK_EQ(e.session_id, 42u);
    CHECK_NEAR(dsm.cooldown_remaining(6.0), 2.0, 1e-9);
    CHECK_NEAR(dsm.cooldown_remaining(9.0), 0.0, 1e-9);
    dsm.reset();
    CHECK(dsm.state() == DetectionState::Idle);
    CHECK_EQ(dsm.windows_seen(), 0u);
}

// Trigger at i iff conf[i] >= T and no earlier trigger j with ts[i] - ts[j] < C
static void matches_reference_definition() {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> conf_dist(0.0f, 1.0f);
    std::uniform_real_distribution<double> gap_dist(0.1, 2.5);
    for (int round = 0; round < 50; ++round) {
        const float T = 0.6f;
        const double C = 3.0;
        DetectionStateMachine dsm(T, C);
        std::vector<double> triggers;
        double ts = 0.0;
        for (int i = 0; i < 200; ++i) {
            ts += gap_dist(rng);
            const float c = conf_dist(rng);
            bool expected = c >= T;
            for (double tj : triggers) {
                if (ts - tj < C) expected = false;
            }
            DetectionEvent e = dsm.on_window(c, ts);
            CHECK_EQ(e.triggered, expected);
            CHECK_EQ(e.suppressed, c >= T && !expected);
            if (e.triggered) triggers.push_back(ts);
        }
    }
}

int main() {
    RUN_TEST(scenario_with_cooldown);
    RUN_TEST(window_at_exact_cooldown_fires);
    RUN_TEST(cooldown_boundary);
    RUN_TEST(threshold_is_inclusive);
    RUN_TEST(below_threshold_never_changes_state);
    RUN_TEST(confidence_is_sanitized);
    RUN_TEST(zero_cooldown_triggers_every_match);
    RUN_TEST(cooldown_remaining_and_reset);
    RUN_TEST(matches_reference_definition);
    return test_check::finish("detection_state_machine_test");
}
