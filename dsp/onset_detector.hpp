#pragma once

#include <vector>

#include "engine_config.hpp"
#include "feature_tensor.hpp"

namespace peckwatch::dsp {

enum class HitPattern { None, Drumming, Foraging };

const char* hit_pattern_name(HitPattern p);

struct OnsetScore {
    HitPattern pattern = HitPattern::None;
    float confidence = 0.0f;
    int peaks = 0;
    float rate = 0.0f;          // peaks per second
    float irregularity = 1.0f;  // std / mean of the intervals between peaks
};

// Spectral-flux onset strength of a log-mel tensor: per frame, the median
// over mel bands of the positive dB increase from the previous frame.
// Frames are shifted by 1 + n_fft / (2 * hop) like librosa's centered
// onset_strength, so the first three values are 0 at the default geometry.
std::vector<float> onset_envelope(const FeatureTensor& tensor, int n_fft, int hop_length);

// Indices n where env[n] > 0 is the maximum of env[n - pre_max, n + post_max),
// env[n] >= mean(env[n - pre_avg, n + post_avg)) + delta, and n is more
// than `wait` frames after the previous peak.
std::vector<int> pick_peaks(const std::vector<float>& env, const OnsetConfig& config);

// Maps peak positions to a drumming (fast, regular) or foraging (slow
// tapping) score.
OnsetScore score_hits(const std::vector<int>& peaks, double frame_seconds, double duration_seconds,
                      const OnsetConfig& config);

// Runs the three steps on one tensor. Windows quieter than min_rms score 0.
class OnsetDetector {
public:
    OnsetDetector(const OnsetConfig& config, int sample_rate, int n_fft, int hop_length, int window_samples);

    OnsetScore analyze(const FeatureTensor& tensor) const;

    const OnsetConfig& get_config() const { return config_; }

private:
    OnsetConfig config_;
    int n_fft_;
    int hop_length_;
    double frame_seconds_;
    double duration_seconds_;
};

} // namespace peckwatch::dsp
