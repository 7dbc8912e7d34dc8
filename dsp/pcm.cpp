#include "pcm.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace peckwatch::dsp {

Status decode_pcm16le(const std::string& bytes, float gain, std::vector<float>& out) {
    out.clear();
    if (bytes.empty() || (bytes.size() % 2) != 0) return Status::DecodeError;

    const size_t n = bytes.size() / 2;
    out.resize(n);
    const float scale = gain / 32768.0f;
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    for (size_t i = 0; i < n; ++i) {
        const int16_t s = static_cast<int16_t>(static_cast<uint16_t>(p[2 * i]) |
                                               (static_cast<uint16_t>(p[2 * i + 1]) << 8));
        out[i] = std::clamp(static_cast<float>(s) * scale, -1.0f, 1.0f);
    }
    return Status::Ok;
}

std::string encode_pcm16le(const std::vector<float>& samples) {
    std::string bytes;
    bytes.resize(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const float c = std::clamp(samples[i], -1.0f, 1.0f);
        const int v = std::clamp(static_cast<int>(std::lround(c * 32768.0f)), -32768, 32767);
        const auto u = static_cast<uint16_t>(static_cast<int16_t>(v));
        bytes[2 * i] = static_cast<char>(u & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((u >> 8) & 0xFF);
    }
    return bytes;
}

float rms(const float* samples, int num_samples) {
    if (!samples || num_samples <= 0) return 0.0f;
    double acc = 0.0;
    for (int i = 0; i < num_samples; ++i) acc += static_cast<double>(samples[i]) * samples[i];
    return static_cast<float>(std::sqrt(acc / num_samples));
}

} // namespace peckwatch::dsp
