#include "session.hpp"

#include "pcm.hpp"

namespace peckwatch {

Session::Session(const SessionResources& resources, std::shared_ptr<SessionStats> stats, SessionCallbacks callbacks,
                 Clock clock, uint32_t seed)
    : res_(resources),
      stats_(std::move(stats)),
      callbacks_(std::move(callbacks)),
      clock_(std::move(clock)),
      rng_(seed),
      mode_(stats_->mode()),
      assembler_(resources.config->features.window_samples(), resources.config->features.window_hop_samples()),
      detector_(resources.config->detection.threshold, resources.config->detection.cooldown_seconds, stats_->id()),
      dispatcher_(*resources.catalog),
      hop_seconds_(static_cast<double>(resources.config->features.window_hop_samples()) /
                   resources.config->features.sample_rate),
      last_audio_(clock_()) {}

void Session::warn(Status code, const std::string& message) {
    if (callbacks_.on_warning) callbacks_.on_warning(code, message);
}

Status Session::on_audio_bytes(const std::string& pcm) {
    Status s = dsp::decode_pcm16le(pcm, res_.config->detection.input_gain, decoded_);
    if (!ok(s)) {
        warn(s, pcm.empty() ? "empty audio payload" : "audio payload is not 16-bit PCM");
        return s;
    }
    on_audio(decoded_);
    return Status::Ok;
}

void Session::on_audio(const std::vector<float>& samples) {
    const double arrival = clock_();
    last_audio_.store(arrival, std::memory_order_relaxed);
    idle_notified_.store(false, std::memory_order_relaxed);
    stats_->record_chunk();

    assembler_.append(samples.data(), static_cast<int>(samples.size()));
    while (assembler_.next_window(window_)) {
        process_window(arrival);
    }
}

float Session::classify(std::string& warning, Status& code) {
    const int n = static_cast<int>(window_.size());
    if (dsp::rms(window_.data(), n) < res_.config->detection.silence_rms) return 0.0f;

    Status s = res_.extractor->extract(window_, tensor_);
    if (!ok(s)) {
        code = s;
        warning = "window could not be converted to features";
        return 0.0f;
    }
    float p = 0.0f;
    std::string err;
    if (!res_.classifier->predict(tensor_, p, err)) {
        code = Status::InferenceError;
        warning = err;
        return 0.0f;
    }
    return p;
}

void Session::process_window(double arrival) {
    std::string warning;
    Status code = Status::Ok;
    const float confidence = classify(warning, code);
    if (!ok(code)) warn(code, warning);

    double t = arrival;
    if (has_window_time_ && t < last_window_time_ + hop_seconds_) t = last_window_time_ + hop_seconds_;
    last_window_time_ = t;
    has_window_time_ = true;

    const dsp::DetectionEvent event = detector_.on_window(confidence, t);
    stats_->record_window(event);

    PlayInstruction play;
    Status d = dispatcher_.dispatch(event, mode_, rng_, play);
    if (ok(d)) {
        stats_->record_play(play.category);
    } else if (d == Status::EmptyCategory) {
        warn(d, std::string("no playable sounds for mode ") + reaction_mode_name(mode_));
    }

    if (callbacks_.on_result) {
        const SessionSnapshot snap = stats_->snapshot();
        WindowResult r;
        r.event = event;
        r.chunk_count = snap.chunks;
        r.detections = snap.detections;
        r.sounds_played = snap.sounds_played;
        r.last_category = snap.last_category;
        callbacks_.on_result(r);
    }
    if (ok(d) && callbacks_.on_play) callbacks_.on_play(play);
}

void Session::set_mode(ReactionMode mode) {
    mode_ = mode;
    stats_->set_mode(mode);
}

Status Session::request_test(PlayInstruction& out) {
    Status s = dispatcher_.test_sound(mode_, rng_, out);
    if (!ok(s)) {
        warn(s, "no playable sounds in the catalog");
        return s;
    }
    stats_->record_play(out.category);
    if (callbacks_.on_play) callbacks_.on_play(out);
    return Status::Ok;
}

bool Session::check_idle(double now, double timeout_seconds) {
    if (timeout_seconds <= 0.0) return false;
    if (now - last_audio_.load(std::memory_order_relaxed) < timeout_seconds) return false;
    bool expected = false;
    return idle_notified_.compare_exchange_strong(expected, true, std::memory_order_relaxed);
}

} // namespace peckwatch
