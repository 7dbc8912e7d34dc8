#pragma once

#include <vector>
#include <complex>

namespace peckwatch::fft {

// Iterative radix-2 FFT with bit-reversal table and per-stage twiddles
// built once at construction. Immutable afterwards, so one plan can be
// shared by every session thread.
class FftPlan {
public:
    explicit FftPlan(int size); // size must be a power of two

    int size() const { return n_; }

    // In-place forward transform; data.size() must equal size().
    void forward(std::vector<std::complex<float>>& data) const;

    // |X[k]|^2 for k = 0..size/2 of a real frame of length size().
    // `scratch` is caller-owned to avoid per-frame allocation.
    void power_spectrum(const float* frame,
                        std::vector<std::complex<float>>& scratch,
                        float* out_power) const;

private:
    int n_ = 0;
    std::vector<int> bitrev_;
    std::vector<std::vector<std::complex<float>>> stages_;
};

bool is_power_of_two(int n);

} // namespace peckwatch::fft
