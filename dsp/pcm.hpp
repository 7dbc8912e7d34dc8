#pragma once

#include <string>
#include <vector>
#include "status_codes.hpp"

namespace peckwatch::dsp {

// Little-endian signed 16-bit PCM bytes -> float samples in [-1, 1),
// multiplied by `gain` and clipped to [-1, 1]. An empty payload or an odd
// byte count (wrong sample width) is a DecodeError.
Status decode_pcm16le(const std::string& bytes, float gain, std::vector<float>& out);

// Inverse of decode_pcm16le at unit gain; used by tools and tests.
std::string encode_pcm16le(const std::vector<float>& samples);

float rms(const float* samples, int num_samples);

} // namespace peckwatch::dsp
