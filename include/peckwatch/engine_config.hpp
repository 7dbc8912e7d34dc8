#pragma once

#include <string>
#include <vector>

namespace peckwatch {

struct FeatureConfig {
    int sample_rate = 22050;
    float window_seconds = 1.0f;
    float window_hop_seconds = 0.0f; // <= 0: same as window_seconds (no overlap)
    int n_fft = 2048;                // must be a power of two
    int hop_length = 512;
    int n_mels = 64;
    float fmin_hz = 0.0f;
    float fmax_hz = 8000.0f;
    float top_db = 80.0f;

    int window_samples() const;
    int window_hop_samples() const;
    int num_frames() const { return 1 + window_samples() / hop_length; }
};

struct DetectionConfig {
    float threshold = 0.75f;         // inclusive, 0..1
    float cooldown_seconds = 3.0f;   // inclusive boundary
    float input_gain = 1.0f;         // applied to decoded samples, then clipped
    float silence_rms = 0.001f;      // windows quieter than this skip the classifier
};

struct CatalogConfig {
    std::string sounds_dir = "static/sounds";
    std::string url_prefix = "/api/sound";
    std::vector<std::string> extensions = {".mp3", ".wav", ".ogg"};
    std::vector<std::string> predator_categories = {"predator_hawk", "predator_owl", "predator_buzzard"};
    std::vector<std::string> woodpecker_categories = {"woodpecker_drumming", "woodpecker_calls"};
    std::string default_mode = "predators";
};

// Drumming/foraging detector over the onset envelope of the log-mel
// tensor. Peak picking follows librosa.util.peak_pick.
struct OnsetConfig {
    float min_rms = 0.015f;          // quieter windows score 0
    int pre_max = 5;                 // frames
    int post_max = 5;
    int pre_avg = 10;
    int post_avg = 10;
    float delta = 0.6f;              // dB above the moving average
    int wait = 8;                    // frames between peaks
    int min_peaks = 2;
    float drum_rate_min = 10.0f;     // hits per second
    float drum_rate_max = 38.0f;
    float drum_max_irregularity = 0.40f;   // std / mean of hit intervals
    float forage_rate_min = 3.0f;
    float forage_rate_max = 9.0f;
    float forage_max_irregularity = 0.50f;
};

struct ClassifierConfig {
    std::string backend = "onnx";    // "onnx" or "onset"
    std::string model_path = "woodpecker_model.onnx";
    int intra_op_threads = 1;
    // Expected input shape, filled from FeatureConfig by the engine
    int n_mels = 64;
    int n_frames = 44;
    // Filled from FeatureConfig by the engine
    int sample_rate = 22050;
    int window_samples = 22050;
    int n_fft = 2048;
    int hop_length = 512;
    OnsetConfig onset;
};

struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    int port = 8000;
    int io_threads = 4;
    float idle_timeout_seconds = 30.0f;
    int max_upload_bytes = 16 << 20; // POST /api/analyze body limit
    std::string log_level = "info"; // trace, debug, info, warn, error
};

struct EngineConfig {
    FeatureConfig features;
    DetectionConfig detection;
    CatalogConfig catalog;
    ClassifierConfig classifier;
    ServerConfig server;
};

} // namespace peckwatch
