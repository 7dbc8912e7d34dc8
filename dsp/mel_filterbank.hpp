#pragma once

#include <vector>

namespace peckwatch::dsp {

// Slaney mel scale (linear below 1 kHz, logarithmic above).
double hz_to_mel(double hz);
double mel_to_hz(double mel);

// Triangular mel filters over the rfft bins of an n_fft frame, with Slaney
// area normalization. Only the non-zero span of each filter is stored.
class MelFilterbank {
public:
    MelFilterbank(int sample_rate, int n_fft, int n_mels, float fmin_hz, float fmax_hz);

    int num_bands() const { return static_cast<int>(bands_.size()); }
    int num_bins() const { return num_bins_; }

    // power: num_bins() values; mel_out: num_bands() values
    void apply(const float* power, float* mel_out) const;

    // Weight of rfft bin `bin` in band `band` (0 outside the filter)
    float weight(int band, int bin) const;

private:
    struct Band {
        int first_bin = 0;
        std::vector<float> weights;
    };
    std::vector<Band> bands_;
    int num_bins_ = 0;
};

} // namespace peckwatch::dsp
