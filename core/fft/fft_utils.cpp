#include "fft/fft_utils.hpp"
#include <cmath>

namespace peckwatch::fft {

bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

FftPlan::FftPlan(int size) : n_(size) {
    if (!is_power_of_two(n_)) n_ = 0;
    if (n_ <= 1) return;

    int bits = 0; while ((1 << bits) < n_) ++bits;
    bitrev_.resize(n_);
    for (int i = 0; i < n_; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        bitrev_[i] = static_cast<int>(r);
    }

    // Twiddles evaluated per index in double (no w *= wlen recurrence)
    const double two_pi = 6.28318530717958647692;
    for (int len = 2; len <= n_; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * static_cast<double>(k) / static_cast<double>(len);
            stage[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
        }
        stages_.push_back(std::move(stage));
    }
}

void FftPlan::forward(std::vector<std::complex<float>>& data) const {
    const int n = static_cast<int>(data.size());
    if (n <= 1 || n != n_) return;

    // Bit-reversal by swapping pairs once
    for (int i = 0; i < n; ++i) {
        const int j = bitrev_[i];
        if (i < j) std::swap(data[i], data[j]);
    }

    int stageIndex = 0;
    for (int len = 2; len <= n; len <<= 1, ++stageIndex) {
        const auto& W = stages_[stageIndex];
        const int half = len / 2;
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

void FftPlan::power_spectrum(const float* frame,
                             std::vector<std::complex<float>>& scratch,
                             float* out_power) const {
    scratch.resize(n_);
    for (int i = 0; i < n_; ++i) scratch[i] = std::complex<float>(frame[i], 0.0f);
    forward(scratch);
    const int bins = n_ / 2 + 1;
    for (int k = 0; k < bins; ++k) out_power[k] = std::norm(scratch[k]);
}

} // namespace peckwatch::fft
