#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "detection/detection_state_machine.hpp"
#include "engine_config.hpp"
#include "feature_extractor.hpp"
#include "reaction_dispatcher.hpp"
#include "sound_catalog.hpp"
#include "stats_aggregator.hpp"
#include "status_codes.hpp"
#include "window_assembler.hpp"

namespace peckwatch {

// Shared, immutable collaborators of every session
struct SessionResources {
    const EngineConfig* config = nullptr;
    const dsp::FeatureExtractor* extractor = nullptr;
    const IClassifier* classifier = nullptr;
    const SoundCatalog* catalog = nullptr;
};

// Outcome of one classified window, with the session counters after it
struct WindowResult {
    dsp::DetectionEvent event;
    uint64_t chunk_count = 0;
    uint64_t detections = 0;
    uint64_t sounds_played = 0;
    std::string last_category;  // empty until something played
};

struct SessionCallbacks {
    std::function<void(const WindowResult&)> on_result;
    std::function<void(const PlayInstruction&)> on_play;
    std::function<void(Status code, const std::string& message)> on_warning;
};

// Session drives the pipeline for one client connection:
// chunk -> window -> features -> classifier -> state machine -> dispatcher.
// All methods except check_idle() must be called from one thread (the
// connection's event loop); check_idle() only touches atomics.
class Session {
public:
    using Clock = std::function<double()>;

    Session(const SessionResources& resources, std::shared_ptr<SessionStats> stats, SessionCallbacks callbacks,
            Clock clock, uint32_t seed);

    uint64_t id() const { return stats_->id(); }

    // Decodes a PCM16LE payload (input gain applied) and feeds it.
    // DecodeError drops the message and sends a warning.
    Status on_audio_bytes(const std::string& pcm);

    // Feeds already-decoded samples; every completed window is classified
    // and reported before this returns. A window is stamped with the
    // arrival time, but never less than one hop after the previous window,
    // so a burst of buffered audio keeps its stream spacing.
    void on_audio(const std::vector<float>& samples);

    void set_mode(ReactionMode mode);
    ReactionMode mode() const { return mode_; }

    // Plays a sound regardless of detection state. EmptyCategory when the
    // catalog has nothing playable.
    Status request_test(PlayInstruction& out);

    // True once per idle period: no audio for `timeout_seconds` at `now`.
    bool check_idle(double now, double timeout_seconds);

    int buffered_samples() const { return assembler_.buffered(); }
    const dsp::DetectionStateMachine& detector() const { return detector_; }
    SessionStats& stats() { return *stats_; }
    double now() const { return clock_(); }

private:
    SessionResources res_;
    std::shared_ptr<SessionStats> stats_;
    SessionCallbacks callbacks_;
    Clock clock_;
    std::mt19937 rng_;

    ReactionMode mode_;
    dsp::WindowAssembler assembler_;
    dsp::DetectionStateMachine detector_;
    ReactionDispatcher dispatcher_;
    std::vector<float> decoded_;
    std::vector<float> window_;
    FeatureTensor tensor_;

    double hop_seconds_;
    double last_window_time_ = 0.0;
    bool has_window_time_ = false;

    std::atomic<double> last_audio_;
    std::atomic<bool> idle_notified_{false};

    void process_window(double arrival);
    float classify(std::string& warning, Status& code);
    void warn(Status code, const std::string& message);
};

} // namespace peckwatch
