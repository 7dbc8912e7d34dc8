#include "pcm.hpp"
#include "test_check.hpp"

#include <string>
#include <vector>

using namespace peckwatch;
using namespace peckwatch::dsp;

static std::string bytes_of(std::initializer_list<int> values) {
    std::string s;
    for (int v : values) s.push_back(static_cast<char>(v & 0xFF));
    return s;
}

static void decodes_little_endian() {
    std::vector<float> out;
    // 0x4000 = 16384, 0xC000 = -16384, 0x7FFF, 0x8000
    CHECK(ok(decode_pcm16le(bytes_of({0x00, 0x40, 0x00, 0xC0, 0xFF, 0x7F, 0x00, 0x80}), 1.0f, out)));
    CHECK_EQ(out.size(), 4u);
    CHECK_NEAR(out[0], 0.5, 1e-6);
    CHECK_NEAR(out[1], -0.5, 1e-6);
    CHECK_NEAR(out[2], 32767.0 / 32768.0, 1e-6);
    CHECK_NEAR(out[3], -1.0, 1e-6);
}

static void gain_is_applied_and_clipped() {
    std::vector<float> out;
    CHECK(ok(decode_pcm16le(bytes_of({0x00, 0x04, 0x00, 0x40, 0x00, 0xC0}), 15.0f, out)));
    CHECK_NEAR(out[0], 15.0 * 1024.0 / 32768.0, 1e-6);
    CHECK_EQ(out[1], 1.0f);
    CHECK_EQ(out[2], -1.0f);
}

static void rejects_bad_payloads() {
    std::vector<float> out;
    CHECK(decode_pcm16le("", 1.0f, out) == Status::DecodeError);
    CHECK(decode_pcm16le(bytes_of({0x01, 0x02, 0x03}), 1.0f, out) == Status::DecodeError);
    CHECK(out.empty());
}

static void encode_round_trips() {
    std::vector<float> in = {0.0f, 0.25f, -0.25f, 0.999f, -1.0f};
    std::vector<float> out;
    CHECK(ok(decode_pcm16le(encode_pcm16le(in), 1.0f, out)));
    CHECK_EQ(out.size(), in.size());
    for (size_t i = 0; i < in.size(); ++i) CHECK_NEAR(out[i], in[i], 1.0 / 32768.0);
}

static void rms_of_constant() {
    std::vector<float> x(100, -0.5f);
    CHECK_NEAR(rms(x.data(), 100), 0.5, 1e-6);
    CHECK_EQ(rms(nullptr, 10), 0.0f);
}

int main() {
    RUN_TEST(decodes_little_endian);
    RUN_TEST(gain_is_applied_and_clipped);
    RUN_TEST(rejects_bad_payloads);
    RUN_TEST(encode_round_trips);
    RUN_TEST(rms_of_constant);
    return test_check::finish("pcm_test");
}
