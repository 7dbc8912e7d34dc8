#include "command_line.hpp"
#include "engine_config_io.hpp"
#include "test_check.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace peckwatch;
namespace fs = std::filesystem;

static void defaults_are_valid() {
    EngineConfig cfg;
    std::string err;
    CHECK(validate_engine_config(cfg, err));
    CHECK(err.empty());
    CHECK_EQ(cfg.features.window_samples(), 22050);
    CHECK_EQ(cfg.features.num_frames(), 44);
}

static void partial_file_keeps_defaults() {
    EngineConfig cfg;
    std::string err;
    CHECK(parse_engine_config(R"({"detection": {"threshold": 0.6}, "server": {"port": 9001}, "extra": 1})", cfg, &err));
    CHECK_NEAR(cfg.detection.threshold, 0.6, 1e-6);
    CHECK_EQ(cfg.server.port, 9001);
    CHECK_NEAR(cfg.detection.cooldown_seconds, 3.0, 1e-6);
    CHECK_EQ(cfg.features.n_mels, 64);
    CHECK_EQ(cfg.catalog.predator_categories.size(), 3u);
}

static void feature_changes_resize_classifier_input() {
    EngineConfig cfg;
    CHECK(parse_engine_config(R"({"features": {"n_mels": 40, "hop_length": 256}})", cfg));
    CHECK_EQ(cfg.classifier.n_mels, 40);
    CHECK_EQ(cfg.classifier.n_frames, 1 + 22050 / 256);
}

static void window_hop_follows_window_length() {
    EngineConfig half;
    std::string err;
    CHECK(parse_engine_config(R"({"features": {"window_seconds": 0.5}})", half));
    CHECK_EQ(half.features.window_samples(), 11025);
    CHECK_EQ(half.features.window_hop_samples(), 11025);
    CHECK(validate_engine_config(half, err));

    EngineConfig two;
    CHECK(parse_engine_config(R"({"features": {"window_seconds": 2.0}})", two));
    CHECK_EQ(two.features.window_hop_samples(), two.features.window_samples());

    EngineConfig overlap;
    CHECK(parse_engine_config(R"({"features": {"window_seconds": 2.0, "window_hop_seconds": 0.5}})", overlap));
    CHECK_EQ(overlap.features.window_hop_samples(), 11025);
    CHECK(validate_engine_config(overlap, err));
}

static void malformed_json_is_rejected() {
    EngineConfig cfg;
    std::string err;
    CHECK(!parse_engine_config("{\"detection\": ", cfg, &err));
    CHECK(!err.empty());
    CHECK(!parse_engine_config("[1, 2]", cfg, &err));
}

static void validation_rules() {
    const std::vector<std::string> bad = {
        R"({"features": {"sample_rate": 0}})",
        R"({"features": {"window_seconds": 0}})",
        R"({"features": {"window_hop_seconds": 2.0}})",
        R"({"features": {"n_fft": 1000}})",
        R"({"features": {"n_fft": 0}})",
        R"({"features": {"fmax_hz": 12000}})",
        R"({"features": {"n_mels": 0}})",
        R"({"detection": {"threshold": 1.01}})",
        R"({"detection": {"threshold": -0.1}})",
        R"({"detection": {"cooldown_seconds": -1}})",
        R"({"server": {"port": 0}})",
        R"({"server": {"port": 70000}})",
        R"({"server": {"max_upload_bytes": 0}})",
        R"({"classifier": {"backend": "tflite"}})",
        R"({"classifier": {"onset": {"min_peaks": 1}}})",
        R"({"classifier": {"onset": {"post_max": 0}}})",
        R"({"classifier": {"onset": {"wait": -1}}})",
    };
    for (const auto& text : bad) {
        EngineConfig cfg;
        std::string err;
        CHECK(parse_engine_config(text, cfg));
        const bool valid = validate_engine_config(cfg, err);
        CHECK(!valid);
        if (valid) std::cerr << "  accepted: " << text << "\n";
    }

    EngineConfig edge;
    CHECK(parse_engine_config(R"({"detection": {"threshold": 1.0, "cooldown_seconds": 0}, "server": {"port": 65535}})", edge));
    std::string err;
    CHECK(validate_engine_config(edge, err));

    EngineConfig onset;
    CHECK(parse_engine_config(R"({"classifier": {"backend": "onset", "onset": {"wait": 4, "delta": 1.5}}})", onset));
    CHECK(validate_engine_config(onset, err));
    CHECK(onset.classifier.backend == "onset");
    CHECK_EQ(onset.classifier.onset.wait, 4);
    CHECK_NEAR(onset.classifier.onset.delta, 1.5, 1e-6);
    CHECK_EQ(onset.classifier.onset.pre_max, 5);
    CHECK_EQ(onset.classifier.hop_length, 512);
    CHECK_EQ(onset.classifier.window_samples, 22050);
}

static void save_then_load() {
    const fs::path path = fs::temp_directory_path() / "peckwatch_config_test.json";
    EngineConfig out;
    out.detection.threshold = 0.8f;
    out.detection.input_gain = 15.0f;
    out.catalog.sounds_dir = "/srv/sounds";
    out.catalog.woodpecker_categories = {"woodpecker_calls"};
    out.server.log_level = "debug";
    CHECK(save_engine_config(path.string(), out));

    EngineConfig in;
    CHECK(load_engine_config(path.string(), in));
    CHECK_NEAR(in.detection.threshold, 0.8, 1e-6);
    CHECK_NEAR(in.detection.input_gain, 15.0, 1e-6);
    CHECK_EQ(in.catalog.sounds_dir, std::string("/srv/sounds"));
    CHECK_EQ(in.catalog.woodpecker_categories.size(), 1u);
    CHECK_EQ(in.server.log_level, std::string("debug"));
    fs::remove(path);

    EngineConfig missing;
    std::string err;
    CHECK(!load_engine_config("/nonexistent/peckwatch.json", missing, &err));
    CHECK(!err.empty());
}

static void effective_config_reports_parse_errors() {
    const fs::path path = fs::temp_directory_path() / "peckwatch_broken_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"detection": {"threshold": )";
    }
    CommandLine cl;
    cl.config_path = path.string();
    cl.config_given = true;
    EngineConfig cfg;
    std::string err;
    CHECK(!load_effective_config(cl, cfg, err));
    CHECK(err.find("cannot parse") != std::string::npos);
    fs::remove(path);
}

static void command_line_overrides_file() {
    const fs::path path = fs::temp_directory_path() / "peckwatch_cli_test.json";
    {
        std::ofstream f(path);
        f << R"({"detection": {"threshold": 0.6, "cooldown_seconds": 5}, "server": {"port": 9000}})";
    }
    const std::string cfg_path = path.string();
    const char* argv[] = {"peckwatch_server", "--config", cfg_path.c_str(), "--port", "8123", "--threshold", "0.9",
                          "--gain", "15"};
    CommandLine cl;
    std::string err;
    CHECK(parse_command_line(9, const_cast<char**>(argv), cl, err));
    CHECK(cl.config_given);

    EngineConfig cfg;
    CHECK(load_effective_config(cl, cfg, err));
    CHECK_EQ(cfg.server.port, 8123);
    CHECK_NEAR(cfg.detection.threshold, 0.9, 1e-6);
    CHECK_NEAR(cfg.detection.cooldown_seconds, 5.0, 1e-6);
    CHECK_NEAR(cfg.detection.input_gain, 15.0, 1e-6);
    fs::remove(path);
}

static void command_line_errors() {
    CommandLine cl;
    std::string err;
    const char* unknown[] = {"x", "--colour", "red"};
    CHECK(!parse_command_line(3, const_cast<char**>(unknown), cl, err));

    CommandLine cl2;
    const char* dangling[] = {"x", "--port"};
    CHECK(!parse_command_line(2, const_cast<char**>(dangling), cl2, err));

    CommandLine cl3;
    const char* bad_value[] = {"x", "--port", "eighty"};
    CHECK(parse_command_line(3, const_cast<char**>(bad_value), cl3, err));
    EngineConfig cfg;
    CHECK(!apply_overrides(cl3, cfg, err));

    CommandLine cl4;
    cl4.config_path = "/nonexistent/peckwatch.json";
    cl4.config_given = true;
    CHECK(!load_effective_config(cl4, cfg, err));

    CommandLine cl5;
    const char* help[] = {"x", "--help"};
    CHECK(parse_command_line(2, const_cast<char**>(help), cl5, err));
    CHECK(cl5.help);
}

int main() {
    RUN_TEST(defaults_are_valid);
    RUN_TEST(partial_file_keeps_defaults);
    RUN_TEST(feature_changes_resize_classifier_input);
    RUN_TEST(window_hop_follows_window_length);
    RUN_TEST(malformed_json_is_rejected);
    RUN_TEST(validation_rules);
    RUN_TEST(save_then_load);
    RUN_TEST(effective_config_reports_parse_errors);
    RUN_TEST(command_line_overrides_file);
    RUN_TEST(command_line_errors);
    return test_check::finish("engine_config_io_test");
}
