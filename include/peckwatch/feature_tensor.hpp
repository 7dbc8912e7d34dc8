#pragma once

#include <vector>

namespace peckwatch {

// One analysis window as a (mel bands x time frames x 1) tensor, stored
// row-major by mel band. Values are normalized to [0, 1].
struct FeatureTensor {
    int n_mels = 0;
    int n_frames = 0;
    std::vector<float> data;

    // Log-mel range (dB) before normalization; data * (db_ceiling -
    // db_floor) recovers dB differences between cells.
    float db_floor = 0.0f;
    float db_ceiling = 0.0f;
    float source_rms = 0.0f;  // RMS of the window the tensor came from

    float at(int mel, int frame) const { return data[static_cast<size_t>(mel) * n_frames + frame]; }
    float db_at(int mel, int frame) const { return db_floor + at(mel, frame) * db_scale(); }
    float db_scale() const { return db_ceiling - db_floor + 1e-8f; }
    bool has_shape(int mels, int frames) const {
        return n_mels == mels && n_frames == frames &&
               data.size() == static_cast<size_t>(mels) * static_cast<size_t>(frames);
    }
};

} // namespace peckwatch
