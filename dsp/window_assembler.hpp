#pragma once

#include <deque>
#include <vector>

namespace peckwatch::dsp {

// FIFO sample buffer that cuts fixed-length analysis windows out of
// variable-length chunks. With hop == window the windows do not overlap;
// with hop < window consecutive windows share (window - hop) samples.
class WindowAssembler {
public:
    WindowAssembler(int window_samples, int hop_samples);

    void append(const float* samples, int num_samples);

    // Copies the oldest complete window into `out` and advances by hop.
    // Returns false while fewer than window_samples() are buffered.
    bool next_window(std::vector<float>& out);

    void clear() { buffer_.clear(); }

    int buffered() const { return static_cast<int>(buffer_.size()); }
    int window_samples() const { return window_; }
    int hop_samples() const { return hop_; }

private:
    int window_;
    int hop_;
    std::deque<float> buffer_;
};

} // namespace peckwatch::dsp
