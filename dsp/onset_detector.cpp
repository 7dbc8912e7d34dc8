#include "onset_detector.hpp"

#include <algorithm>
#include <cmath>

namespace peckwatch::dsp {

const char* hit_pattern_name(HitPattern p) {
    switch (p) {
        case HitPattern::None: return "none";
        case HitPattern::Drumming: return "drumming";
        case HitPattern::Foraging: return "foraging";
    }
    return "none";
}

static float median(std::vector<float>& v) {
    if (v.empty()) return 0.0f;
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    const float upper = v[mid];
    if (v.size() % 2 == 1) return upper;
    const float lower = *std::max_element(v.begin(), v.begin() + mid);
    return 0.5f * (lower + upper);
}

std::vector<float> onset_envelope(const FeatureTensor& tensor, int n_fft, int hop_length) {
    const int frames = tensor.n_frames;
    std::vector<float> env(frames > 0 ? frames : 0, 0.0f);
    if (frames < 2 || tensor.n_mels < 1 || hop_length <= 0) return env;

    const int shift = 1 + n_fft / (2 * hop_length);
    const float scale = tensor.db_scale();
    std::vector<float> rise(tensor.n_mels);
    for (int t = 1; t < frames; ++t) {
        const int out = t - 1 + shift;
        if (out >= frames) break;
        for (int m = 0; m < tensor.n_mels; ++m) {
            rise[m] = std::max(0.0f, (tensor.at(m, t) - tensor.at(m, t - 1)) * scale);
        }
        env[out] = median(rise);
    }
    return env;
}

std::vector<int> pick_peaks(const std::vector<float>& env, const OnsetConfig& config) {
    std::vector<int> peaks;
    const int n = static_cast<int>(env.size());
    int last = 0;
    bool have_last = false;
    for (int i = 0; i < n; ++i) {
        const float x = env[i];
        if (x <= 0.0f) continue;

        const int max_lo = std::max(0, i - config.pre_max);
        const int max_hi = std::min(n, i + config.post_max);
        const float local_max = *std::max_element(env.begin() + max_lo, env.begin() + max_hi);
        if (x != local_max) continue;

        const int avg_lo = std::max(0, i - config.pre_avg);
        const int avg_hi = std::min(n, i + config.post_avg);
        double sum = 0.0;
        for (int k = avg_lo; k < avg_hi; ++k) sum += env[k];
        const double mean = sum / (avg_hi - avg_lo);
        if (x < mean + config.delta) continue;

        if (have_last && i <= last + config.wait) continue;
        peaks.push_back(i);
        last = i;
        have_last = true;
    }
    return peaks;
}

OnsetScore score_hits(const std::vector<int>& peaks, double frame_seconds, double duration_seconds,
                      const OnsetConfig& config) {
    OnsetScore score;
    score.peaks = static_cast<int>(peaks.size());
    if (score.peaks < std::max(2, config.min_peaks) || duration_seconds <= 0.0) return score;

    const double rate = score.peaks / duration_seconds;
    std::vector<double> intervals;
    intervals.reserve(peaks.size() - 1);
    for (size_t i = 1; i < peaks.size(); ++i) intervals.push_back((peaks[i] - peaks[i - 1]) * frame_seconds);
    double mean = 0.0;
    for (double d : intervals) mean += d;
    mean /= intervals.size();
    double var = 0.0;
    for (double d : intervals) var += (d - mean) * (d - mean);
    var /= intervals.size();
    const double irregularity = mean > 0.0 ? std::sqrt(var) / mean : 1.0;

    score.rate = static_cast<float>(rate);
    score.irregularity = static_cast<float>(irregularity);

    if (rate >= config.drum_rate_min && rate <= config.drum_rate_max &&
        irregularity <= config.drum_max_irregularity) {
        score.pattern = HitPattern::Drumming;
        score.confidence = static_cast<float>(std::min(0.95, 0.6 + (1.0 - irregularity) * 0.4));
    } else if (rate >= config.forage_rate_min && rate <= config.forage_rate_max &&
               irregularity <= config.forage_max_irregularity) {
        score.pattern = HitPattern::Foraging;
        score.confidence = static_cast<float>(std::min(0.75, 0.5 + rate / 20.0));
    }
    return score;
}

OnsetDetector::OnsetDetector(const OnsetConfig& config, int sample_rate, int n_fft, int hop_length,
                             int window_samples)
    : config_(config),
      n_fft_(n_fft),
      hop_length_(hop_length),
      frame_seconds_(sample_rate > 0 ? static_cast<double>(hop_length) / sample_rate : 0.0),
      duration_seconds_(sample_rate > 0 ? static_cast<double>(window_samples) / sample_rate : 0.0) {}

OnsetScore OnsetDetector::analyze(const FeatureTensor& tensor) const {
    if (tensor.source_rms < config_.min_rms) return OnsetScore();
    const std::vector<float> env = onset_envelope(tensor, n_fft_, hop_length_);
    const std::vector<int> peaks = pick_peaks(env, config_);
    return score_hits(peaks, frame_seconds_, duration_seconds_, config_);
}

} // namespace peckwatch::dsp
