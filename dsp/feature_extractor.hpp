#pragma once

#include <vector>
#include "engine_config.hpp"
#include "feature_tensor.hpp"
#include "status_codes.hpp"
#include "fft/fft_utils.hpp"
#include "mel_filterbank.hpp"

namespace peckwatch::dsp {

// FeatureExtractor turns one analysis window into the log-mel tensor the
// classifier was trained on: centered Hann frames, power spectrum, Slaney
// mel bands, power_to_db (ref = max, top_db clamp), then per-tensor
// min-max normalization. Stateless after construction; extract() may be
// called concurrently.
class FeatureExtractor {
public:
    explicit FeatureExtractor(const FeatureConfig& config);

    // Fails with InvalidWindowLength unless num_samples == window_samples().
    Status extract(const float* samples, int num_samples, FeatureTensor& out) const;
    Status extract(const std::vector<float>& window, FeatureTensor& out) const {
        return extract(window.data(), static_cast<int>(window.size()), out);
    }

    int window_samples() const { return window_samples_; }
    int num_frames() const { return num_frames_; }
    int num_mels() const { return config_.n_mels; }
    const FeatureConfig& get_config() const { return config_; }

private:
    FeatureConfig config_;
    int window_samples_ = 0;
    int num_frames_ = 0;
    fft::FftPlan plan_;
    MelFilterbank mel_;
    std::vector<float> hann_;
};

} // namespace peckwatch::dsp
