#include "window_assembler.hpp"
#include "test_check.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <vector>

using namespace peckwatch::dsp;

static std::vector<float> ramp(int n, float start = 0.0f) {
    std::vector<float> x(n);
    std::iota(x.begin(), x.end(), start);
    return x;
}

static void arbitrary_chunks_make_one_window() {
    const int W = 22050;
    const std::vector<float> signal = ramp(W);

    WindowAssembler whole(W, W);
    whole.append(signal.data(), W);
    std::vector<float> expected;
    CHECK(whole.next_window(expected));

    std::mt19937 rng(11);
    for (int round = 0; round < 20; ++round) {
        WindowAssembler wa(W, W);
        std::uniform_int_distribution<int> size_dist(1, 4000);
        int pos = 0;
        int windows = 0;
        std::vector<float> out;
        while (pos < W) {
            const int n = std::min(size_dist(rng), W - pos);
            wa.append(signal.data() + pos, n);
            pos += n;
            while (wa.next_window(out)) ++windows;
        }
        CHECK_EQ(windows, 1);
        CHECK(out == expected);
        CHECK_EQ(wa.buffered(), 0);
    }
}

static void trailing_samples_stay_buffered() {
    WindowAssembler wa(100, 100);
    auto x = ramp(250);
    wa.append(x.data(), 250);
    std::vector<float> out;
    CHECK(wa.next_window(out));
    CHECK_EQ(out.front(), 0.0f);
    CHECK(wa.next_window(out));
    CHECK_EQ(out.front(), 100.0f);
    CHECK(!wa.next_window(out));
    CHECK_EQ(wa.buffered(), 50);

    auto more = ramp(50, 250.0f);
    wa.append(more.data(), 50);
    CHECK(wa.next_window(out));
    CHECK_EQ(out.front(), 200.0f);
    CHECK_EQ(out.back(), 299.0f);
}

static void overlapping_hop() {
    WindowAssembler wa(100, 25);
    auto x = ramp(200);
    wa.append(x.data(), 200);
    std::vector<float> out;
    int n = 0;
    while (wa.next_window(out)) {
        CHECK_EQ(out.front(), static_cast<float>(25 * n));
        CHECK_EQ(static_cast<int>(out.size()), 100);
        ++n;
    }
    CHECK_EQ(n, 5);
    CHECK_EQ(wa.buffered(), 75);
}

static void hop_is_clamped_and_clear_discards() {
    WindowAssembler wa(10, 50);
    CHECK_EQ(wa.hop_samples(), 10);
    WindowAssembler wb(10, 0);
    CHECK_EQ(wb.hop_samples(), 1);

    auto x = ramp(7);
    wa.append(x.data(), 7);
    wa.append(nullptr, 5);
    CHECK_EQ(wa.buffered(), 7);
    wa.clear();
    CHECK_EQ(wa.buffered(), 0);
}

int main() {
    RUN_TEST(arbitrary_chunks_make_one_window);
    RUN_TEST(trailing_samples_stay_buffered);
    RUN_TEST(overlapping_hop);
    RUN_TEST(hop_is_clamped_and_clear_discards);
    return test_check::finish("window_assembler_test");
}
