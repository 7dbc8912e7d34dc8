#include "window_assembler.hpp"

#include <algorithm>

namespace peckwatch::dsp {

WindowAssembler::WindowAssembler(int window_samples, int hop_samples)
    : window_(std::max(1, window_samples)),
      hop_(std::max(1, std::min(hop_samples, std::max(1, window_samples)))) {}

void WindowAssembler::append(const float* samples, int num_samples) {
    if (!samples || num_samples <= 0) return;
    buffer_.insert(buffer_.end(), samples, samples + num_samples);
}

bool WindowAssembler::next_window(std::vector<float>& out) {
    if (static_cast<int>(buffer_.size()) < window_) return false;
    out.assign(buffer_.begin(), buffer_.begin() + window_);
    buffer_.erase(buffer_.begin(), buffer_.begin() + hop_);
    return true;
}

} // namespace peckwatch::dsp
