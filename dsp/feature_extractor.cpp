#include "feature_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <complex>

namespace peckwatch::dsp {

namespace {
constexpr float kAmin = 1e-10f;
constexpr float kNormEps = 1e-8f;
}

FeatureExtractor::FeatureExtractor(const FeatureConfig& config)
    : config_(config),
      window_samples_(config.window_samples()),
      num_frames_(config.num_frames()),
      plan_(config.n_fft),
      mel_(config.sample_rate, config.n_fft, config.n_mels, config.fmin_hz, config.fmax_hz) {
    // Periodic Hann (fftbins=True)
    hann_.resize(config_.n_fft);
    const double two_pi = 6.283185307179586;
    for (int i = 0; i < config_.n_fft; ++i) {
        hann_[i] = static_cast<float>(0.5 - 0.5 * std::cos(two_pi * i / static_cast<double>(config_.n_fft)));
    }
}

Status FeatureExtractor::extract(const float* samples, int num_samples, FeatureTensor& out) const {
    if (!samples || num_samples != window_samples_ || window_samples_ <= 0) {
        return Status::InvalidWindowLength;
    }

    const int n_fft = config_.n_fft;
    const int hop = config_.hop_length;
    const int pad = n_fft / 2;
    const int n_bins = n_fft / 2 + 1;
    const int n_mels = config_.n_mels;

    // Centered framing with zero padding on both sides
    std::vector<float> padded(static_cast<size_t>(num_samples) + 2 * pad, 0.0f);
    std::copy(samples, samples + num_samples, padded.begin() + pad);

    out.n_mels = n_mels;
    out.n_frames = num_frames_;
    out.data.assign(static_cast<size_t>(n_mels) * num_frames_, 0.0f);

    std::vector<float> frame(n_fft);
    std::vector<float> power(n_bins);
    std::vector<float> mel(n_mels);
    std::vector<std::complex<float>> scratch;

    float ref = 0.0f;
    for (int t = 0; t < num_frames_; ++t) {
        const float* src = padded.data() + static_cast<size_t>(t) * hop;
        for (int i = 0; i < n_fft; ++i) frame[i] = src[i] * hann_[i];
        plan_.power_spectrum(frame.data(), scratch, power.data());
        mel_.apply(power.data(), mel.data());
        for (int m = 0; m < n_mels; ++m) {
            out.data[static_cast<size_t>(m) * num_frames_ + t] = mel[m];
            ref = std::max(ref, mel[m]);
        }
    }

    // power_to_db(S, ref=np.max, top_db)
    const float ref_db = 10.0f * std::log10(std::max(kAmin, ref));
    float db_max = -1e30f;
    for (float& v : out.data) {
        v = 10.0f * std::log10(std::max(kAmin, v)) - ref_db;
        db_max = std::max(db_max, v);
    }
    const float floor_db = db_max - config_.top_db;
    float lo = 1e30f, hi = -1e30f;
    for (float& v : out.data) {
        v = std::max(v, floor_db);
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    const float scale = 1.0f / (hi - lo + kNormEps);
    for (float& v : out.data) v = (v - lo) * scale;
    out.db_floor = lo;
    out.db_ceiling = hi;

    double energy = 0.0;
    for (int i = 0; i < num_samples; ++i) energy += static_cast<double>(samples[i]) * samples[i];
    out.source_rms = static_cast<float>(std::sqrt(energy / num_samples));
    return Status::Ok;
}

} // namespace peckwatch::dsp
