#pragma once

#include <string>
#include <vector>

#include "status_codes.hpp"

namespace peckwatch::dsp {

struct WavAudio {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    std::vector<float> samples;  // mono mix in [-1, 1]
};

// Parses a RIFF/WAVE file held in memory: integer PCM (8, 16, 24 or 32
// bit) or IEEE float (32 or 64 bit), any channel count, mixed down to
// mono. DecodeError with `error` set for anything else.
Status decode_wav(const std::string& bytes, WavAudio& out, std::string& error);

// Linear-interpolation resampler; returns `in` unchanged when the rates
// match.
std::vector<float> resample_linear(const std::vector<float>& in, int from_rate, int to_rate);

} // namespace peckwatch::dsp
