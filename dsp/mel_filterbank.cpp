#include "mel_filterbank.hpp"

#include <algorithm>
#include <cmath>

namespace peckwatch::dsp {

namespace {
constexpr double kFSp = 200.0 / 3.0;
constexpr double kMinLogHz = 1000.0;
constexpr double kMinLogMel = kMinLogHz / kFSp; // 15
const double kLogStep = std::log(6.4) / 27.0;
}

double hz_to_mel(double hz) {
    if (hz >= kMinLogHz) return kMinLogMel + std::log(hz / kMinLogHz) / kLogStep;
    return hz / kFSp;
}

double mel_to_hz(double mel) {
    if (mel >= kMinLogMel) return kMinLogHz * std::exp(kLogStep * (mel - kMinLogMel));
    return kFSp * mel;
}

MelFilterbank::MelFilterbank(int sample_rate, int n_fft, int n_mels, float fmin_hz, float fmax_hz) {
    num_bins_ = n_fft / 2 + 1;
    if (n_mels <= 0 || n_fft <= 0 || sample_rate <= 0) return;

    // n_mels + 2 edge frequencies evenly spaced in mel
    const double mel_lo = hz_to_mel(fmin_hz);
    const double mel_hi = hz_to_mel(fmax_hz);
    std::vector<double> edges(n_mels + 2);
    for (int i = 0; i < n_mels + 2; ++i) {
        const double m = mel_lo + (mel_hi - mel_lo) * static_cast<double>(i) / static_cast<double>(n_mels + 1);
        edges[i] = mel_to_hz(m);
    }

    const double bin_hz = static_cast<double>(sample_rate) / static_cast<double>(n_fft);
    bands_.resize(n_mels);
    for (int b = 0; b < n_mels; ++b) {
        const double lo = edges[b], mid = edges[b + 1], hi = edges[b + 2];
        const double enorm = 2.0 / (hi - lo);
        Band& band = bands_[b];
        band.first_bin = -1;
        for (int k = 0; k < num_bins_; ++k) {
            const double f = bin_hz * static_cast<double>(k);
            const double lower = (f - lo) / (mid - lo);
            const double upper = (hi - f) / (hi - mid);
            const double w = std::max(0.0, std::min(lower, upper)) * enorm;
            if (w <= 0.0) {
                if (band.first_bin >= 0) break;
                continue;
            }
            if (band.first_bin < 0) band.first_bin = k;
            band.weights.push_back(static_cast<float>(w));
        }
        if (band.first_bin < 0) band.first_bin = 0; // filter narrower than one bin
    }
}

void MelFilterbank::apply(const float* power, float* mel_out) const {
    for (size_t b = 0; b < bands_.size(); ++b) {
        const Band& band = bands_[b];
        double acc = 0.0;
        for (size_t i = 0; i < band.weights.size(); ++i) {
            acc += static_cast<double>(band.weights[i]) * power[band.first_bin + i];
        }
        mel_out[b] = static_cast<float>(acc);
    }
}

float MelFilterbank::weight(int band, int bin) const {
    if (band < 0 || band >= num_bands()) return 0.0f;
    const Band& b = bands_[band];
    const int idx = bin - b.first_bin;
    if (idx < 0 || idx >= static_cast<int>(b.weights.size())) return 0.0f;
    return b.weights[idx];
}

} // namespace peckwatch::dsp
