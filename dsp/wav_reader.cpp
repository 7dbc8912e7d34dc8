#include "wav_reader.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <sstream>

namespace peckwatch::dsp {

namespace {
constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t le16(const unsigned char* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }
uint32_t le32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

float read_sample(const unsigned char* p, int bits, bool is_float) {
    if (is_float) {
        if (bits == 32) {
            uint32_t u = le32(p);
            float f;
            std::memcpy(&f, &u, sizeof(f));
            return f;
        }
        uint64_t u = static_cast<uint64_t>(le32(p)) | (static_cast<uint64_t>(le32(p + 4)) << 32);
        double d;
        std::memcpy(&d, &u, sizeof(d));
        return static_cast<float>(d);
    }
    switch (bits) {
        case 8: return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 16: return static_cast<int16_t>(le16(p)) / 32768.0f;
        case 24: {
            int32_t raw = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) |
                          (static_cast<int32_t>(p[2]) << 16);
            if (raw & 0x800000) raw |= static_cast<int32_t>(0xFF000000);
            return raw / 8388608.0f;
        }
        default: return static_cast<int32_t>(le32(p)) / 2147483648.0f;
    }
}
} // namespace

Status decode_wav(const std::string& bytes, WavAudio& out, std::string& error) {
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t size = bytes.size();
    if (size < 12 || std::memcmp(data, "RIFF", 4) != 0 || std::memcmp(data + 8, "WAVE", 4) != 0) {
        error = "not a RIFF/WAVE file";
        return Status::DecodeError;
    }

    uint16_t format = 0;
    int channels = 0;
    int sample_rate = 0;
    int bits = 0;
    bool have_fmt = false;
    const unsigned char* pcm = nullptr;
    size_t pcm_size = 0;

    size_t pos = 12;
    while (pos + 8 <= size) {
        const unsigned char* chunk = data + pos;
        const uint32_t chunk_size = le32(chunk + 4);
        const size_t body = pos + 8;
        const size_t available = size - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || available < 16) {
                error = "truncated fmt chunk";
                return Status::DecodeError;
            }
            format = le16(data + body);
            channels = le16(data + body + 2);
            sample_rate = static_cast<int>(le32(data + body + 4));
            bits = le16(data + body + 14);
            if (format == kFormatExtensible && chunk_size >= 26 && available >= 26) {
                format = le16(data + body + 24);
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            pcm = data + body;
            // Streaming writers leave the size unset; take what is there
            pcm_size = chunk_size > available ? available : chunk_size;
            break;
        }
        pos = body + ((static_cast<size_t>(chunk_size) + 1) & ~static_cast<size_t>(1));
    }

    if (!have_fmt || !pcm) {
        error = have_fmt ? "no data chunk" : "no fmt chunk before the data";
        return Status::DecodeError;
    }
    const bool is_float = format == kFormatFloat;
    const bool supported = (format == kFormatPcm && (bits == 8 || bits == 16 || bits == 24 || bits == 32)) ||
                           (is_float && (bits == 32 || bits == 64));
    if (!supported || channels < 1 || sample_rate <= 0) {
        std::ostringstream os;
        os << "unsupported WAV encoding (format " << format << ", " << bits << " bit, " << channels
           << " channels, " << sample_rate << " Hz)";
        error = os.str();
        return Status::DecodeError;
    }

    const size_t frame_bytes = static_cast<size_t>(bits / 8) * channels;
    const size_t frames = pcm_size / frame_bytes;
    if (frames == 0) {
        error = "WAV file holds no samples";
        return Status::DecodeError;
    }

    out.sample_rate = sample_rate;
    out.channels = channels;
    out.bits_per_sample = bits;
    out.samples.resize(frames);
    for (size_t i = 0; i < frames; ++i) {
        const unsigned char* frame = pcm + i * frame_bytes;
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) sum += read_sample(frame + ch * (bits / 8), bits, is_float);
        float v = sum / channels;
        if (!std::isfinite(v)) v = 0.0f;
        out.samples[i] = v < -1.0f ? -1.0f : (v > 1.0f ? 1.0f : v);
    }
    return Status::Ok;
}

std::vector<float> resample_linear(const std::vector<float>& in, int from_rate, int to_rate) {
    if (from_rate == to_rate || from_rate <= 0 || to_rate <= 0 || in.empty()) return in;
    const size_t n_out = static_cast<size_t>(
        std::llround(static_cast<double>(in.size()) * to_rate / static_cast<double>(from_rate)));
    std::vector<float> out(n_out);
    const double step = static_cast<double>(from_rate) / to_rate;
    const size_t last = in.size() - 1;
    for (size_t i = 0; i < n_out; ++i) {
        const double x = i * step;
        size_t i0 = static_cast<size_t>(x);
        if (i0 >= last) {
            out[i] = in[last];
            continue;
        }
        const float frac = static_cast<float>(x - static_cast<double>(i0));
        out[i] = in[i0] + (in[i0 + 1] - in[i0]) * frac;
    }
    return out;
}

} // namespace peckwatch::dsp
