#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "engine_config.hpp"
#include "feature_extractor.hpp"
#include "session.hpp"
#include "sound_catalog.hpp"
#include "stats_aggregator.hpp"
#include "status_service.hpp"

namespace peckwatch {

// Result of classifying a whole recorded clip
struct ClipAnalysis {
    int windows = 0;
    double duration_seconds = 0.0;
    float probability = 0.0f;     // highest window confidence
    bool detected = false;        // probability >= threshold
    std::vector<float> confidences;
};

// Engine owns the process-wide state: configuration, the feature
// extractor, the classifier, the sound catalog and the statistics.
// start() runs once before any session is opened; afterwards the shared
// parts are read-only and sessions may be opened from any thread.
class Engine {
public:
    Engine(const EngineConfig& config, std::unique_ptr<IClassifier> classifier);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Validates the configuration, scans the catalog and loads the model.
    // Every fatal problem is appended to `errors`; returns ready().
    bool start(std::vector<std::string>& errors);
    bool ready() const { return status_.ready(); }

    // Creates a session in the default reaction mode. Returns nullptr and
    // NotReady when the engine did not start cleanly.
    std::shared_ptr<Session> open_session(SessionCallbacks callbacks, Status& status);
    void close_session(const Session& session);

    // One-shot classification of a clip already at the configured sample
    // rate. Every hop-spaced window is scored and a short tail is zero
    // padded. Detection state and statistics are untouched. NotReady
    // before a clean start, InferenceError (with `error`) when the
    // classifier fails.
    Status analyze_clip(const std::vector<float>& samples, ClipAnalysis& out, std::string& error) const;

    // Overrides the session clock and seed source (tests)
    void set_clock(Session::Clock clock) { clock_ = std::move(clock); }
    void set_seed(uint32_t seed) { seed_ = seed; fixed_seed_ = true; }

    const EngineConfig& get_config() const { return config_; }
    const SoundCatalog& catalog() const { return catalog_; }
    const StatsAggregator& stats() const { return stats_; }
    StatsAggregator& stats() { return stats_; }
    const StatusService& status() const { return status_; }
    ReactionMode default_mode() const { return default_mode_; }

    double now() const { return clock_(); }

private:
    EngineConfig config_;
    std::unique_ptr<IClassifier> classifier_;
    std::unique_ptr<dsp::FeatureExtractor> extractor_;
    SoundCatalog catalog_;
    StatsAggregator stats_;
    StatusService status_;
    ReactionMode default_mode_ = ReactionMode::Predators;

    Session::Clock clock_;
    std::atomic<uint32_t> seed_{0};
    std::atomic<bool> fixed_seed_{false};

    uint32_t next_seed();
};

} // namespace peckwatch
