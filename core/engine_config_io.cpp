#include "engine_config.hpp"
#include "engine_config_io.hpp"
#include "fft/fft_utils.hpp"

#include <json/json.h>

#include <cmath>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

namespace peckwatch {

int FeatureConfig::window_samples() const {
    return static_cast<int>(std::lround(static_cast<double>(window_seconds) * sample_rate));
}

int FeatureConfig::window_hop_samples() const {
    if (window_hop_seconds <= 0.0f) return window_samples();
    return static_cast<int>(std::lround(static_cast<double>(window_hop_seconds) * sample_rate));
}

static void read_value(const Json::Value& obj, const char* key, float& out) {
    const Json::Value& v = obj[key];
    if (v.isNumeric()) out = v.asFloat();
}
static void read_value(const Json::Value& obj, const char* key, int& out) {
    const Json::Value& v = obj[key];
    if (v.isIntegral()) out = v.asInt();
    else if (v.isDouble()) out = static_cast<int>(v.asDouble());
}
static void read_value(const Json::Value& obj, const char* key, std::string& out) {
    const Json::Value& v = obj[key];
    if (v.isString()) out = v.asString();
}
static void read_value(const Json::Value& obj, const char* key, std::vector<std::string>& out) {
    const Json::Value& v = obj[key];
    if (!v.isArray()) return;
    out.clear();
    for (const auto& item : v) {
        if (item.isString()) out.push_back(item.asString());
    }
}

static Json::Value string_array(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : values) arr.append(s);
    return arr;
}

bool parse_engine_config(const std::string& json_text, EngineConfig& cfg, std::string* error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs)) {
        if (error) *error = errs;
        return false;
    }
    if (!root.isObject()) {
        if (error) *error = "top-level value is not an object";
        return false;
    }

    const Json::Value& f = root["features"];
    if (f.isObject()) {
        read_value(f, "sample_rate", cfg.features.sample_rate);
        read_value(f, "window_seconds", cfg.features.window_seconds);
        read_value(f, "window_hop_seconds", cfg.features.window_hop_seconds);
        read_value(f, "n_fft", cfg.features.n_fft);
        read_value(f, "hop_length", cfg.features.hop_length);
        read_value(f, "n_mels", cfg.features.n_mels);
        read_value(f, "fmin_hz", cfg.features.fmin_hz);
        read_value(f, "fmax_hz", cfg.features.fmax_hz);
        read_value(f, "top_db", cfg.features.top_db);
    }
    const Json::Value& d = root["detection"];
    if (d.isObject()) {
        read_value(d, "threshold", cfg.detection.threshold);
        read_value(d, "cooldown_seconds", cfg.detection.cooldown_seconds);
        read_value(d, "input_gain", cfg.detection.input_gain);
        read_value(d, "silence_rms", cfg.detection.silence_rms);
    }
    const Json::Value& c = root["catalog"];
    if (c.isObject()) {
        read_value(c, "sounds_dir", cfg.catalog.sounds_dir);
        read_value(c, "url_prefix", cfg.catalog.url_prefix);
        read_value(c, "extensions", cfg.catalog.extensions);
        read_value(c, "predator_categories", cfg.catalog.predator_categories);
        read_value(c, "woodpecker_categories", cfg.catalog.woodpecker_categories);
        read_value(c, "default_mode", cfg.catalog.default_mode);
    }
    const Json::Value& m = root["classifier"];
    if (m.isObject()) {
        read_value(m, "backend", cfg.classifier.backend);
        read_value(m, "model_path", cfg.classifier.model_path);
        read_value(m, "intra_op_threads", cfg.classifier.intra_op_threads);
        const Json::Value& o = m["onset"];
        if (o.isObject()) {
            OnsetConfig& oc = cfg.classifier.onset;
            read_value(o, "min_rms", oc.min_rms);
            read_value(o, "pre_max", oc.pre_max);
            read_value(o, "post_max", oc.post_max);
            read_value(o, "pre_avg", oc.pre_avg);
            read_value(o, "post_avg", oc.post_avg);
            read_value(o, "delta", oc.delta);
            read_value(o, "wait", oc.wait);
            read_value(o, "min_peaks", oc.min_peaks);
            read_value(o, "drum_rate_min", oc.drum_rate_min);
            read_value(o, "drum_rate_max", oc.drum_rate_max);
            read_value(o, "drum_max_irregularity", oc.drum_max_irregularity);
            read_value(o, "forage_rate_min", oc.forage_rate_min);
            read_value(o, "forage_rate_max", oc.forage_rate_max);
            read_value(o, "forage_max_irregularity", oc.forage_max_irregularity);
        }
    }
    const Json::Value& s = root["server"];
    if (s.isObject()) {
        read_value(s, "listen_address", cfg.server.listen_address);
        read_value(s, "port", cfg.server.port);
        read_value(s, "io_threads", cfg.server.io_threads);
        read_value(s, "idle_timeout_seconds", cfg.server.idle_timeout_seconds);
        read_value(s, "max_upload_bytes", cfg.server.max_upload_bytes);
        read_value(s, "log_level", cfg.server.log_level);
    }
    sync_classifier_shape(cfg);
    return true;
}

void sync_classifier_shape(EngineConfig& cfg) {
    cfg.classifier.n_mels = cfg.features.n_mels;
    cfg.classifier.n_frames = cfg.features.hop_length > 0 ? cfg.features.num_frames() : 0;
    cfg.classifier.sample_rate = cfg.features.sample_rate;
    cfg.classifier.window_samples = cfg.features.window_samples();
    cfg.classifier.n_fft = cfg.features.n_fft;
    cfg.classifier.hop_length = cfg.features.hop_length;
}

bool load_engine_config(const std::string& path, EngineConfig& cfg, std::string* error) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        if (error) *error = "cannot read " + path;
        return false;
    }
    std::string parse_error;
    if (!parse_engine_config(text, cfg, &parse_error)) {
        if (error) *error = "cannot parse " + path + ": " + parse_error;
        return false;
    }
    return true;
}

bool save_engine_config(const std::string& path, const EngineConfig& cfg) {
    Json::Value root(Json::objectValue);

    Json::Value& f = root["features"];
    f["sample_rate"] = cfg.features.sample_rate;
    f["window_seconds"] = cfg.features.window_seconds;
    f["window_hop_seconds"] = cfg.features.window_hop_seconds;
    f["n_fft"] = cfg.features.n_fft;
    f["hop_length"] = cfg.features.hop_length;
    f["n_mels"] = cfg.features.n_mels;
    f["fmin_hz"] = cfg.features.fmin_hz;
    f["fmax_hz"] = cfg.features.fmax_hz;
    f["top_db"] = cfg.features.top_db;

    Json::Value& d = root["detection"];
    d["threshold"] = cfg.detection.threshold;
    d["cooldown_seconds"] = cfg.detection.cooldown_seconds;
    d["input_gain"] = cfg.detection.input_gain;
    d["silence_rms"] = cfg.detection.silence_rms;

    Json::Value& c = root["catalog"];
    c["sounds_dir"] = cfg.catalog.sounds_dir;
    c["url_prefix"] = cfg.catalog.url_prefix;
    c["extensions"] = string_array(cfg.catalog.extensions);
    c["predator_categories"] = string_array(cfg.catalog.predator_categories);
    c["woodpecker_categories"] = string_array(cfg.catalog.woodpecker_categories);
    c["default_mode"] = cfg.catalog.default_mode;

    Json::Value& m = root["classifier"];
    m["backend"] = cfg.classifier.backend;
    m["model_path"] = cfg.classifier.model_path;
    m["intra_op_threads"] = cfg.classifier.intra_op_threads;
    const OnsetConfig& oc = cfg.classifier.onset;
    Json::Value& o = m["onset"];
    o["min_rms"] = oc.min_rms;
    o["pre_max"] = oc.pre_max;
    o["post_max"] = oc.post_max;
    o["pre_avg"] = oc.pre_avg;
    o["post_avg"] = oc.post_avg;
    o["delta"] = oc.delta;
    o["wait"] = oc.wait;
    o["min_peaks"] = oc.min_peaks;
    o["drum_rate_min"] = oc.drum_rate_min;
    o["drum_rate_max"] = oc.drum_rate_max;
    o["drum_max_irregularity"] = oc.drum_max_irregularity;
    o["forage_rate_min"] = oc.forage_rate_min;
    o["forage_rate_max"] = oc.forage_rate_max;
    o["forage_max_irregularity"] = oc.forage_max_irregularity;

    Json::Value& s = root["server"];
    s["listen_address"] = cfg.server.listen_address;
    s["port"] = cfg.server.port;
    s["io_threads"] = cfg.server.io_threads;
    s["idle_timeout_seconds"] = cfg.server.idle_timeout_seconds;
    s["max_upload_bytes"] = cfg.server.max_upload_bytes;
    s["log_level"] = cfg.server.log_level;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const std::string text = Json::writeString(builder, root) + "\n";

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    out << text;
    out.flush();
    return static_cast<bool>(out);
}

bool validate_engine_config(const EngineConfig& cfg, std::string& error) {
    std::ostringstream os;
    const FeatureConfig& f = cfg.features;
    if (f.sample_rate <= 0) os << "features.sample_rate must be positive";
    else if (f.window_seconds <= 0.0f || f.window_samples() <= 0) os << "features.window_seconds must be positive";
    else if (f.window_hop_samples() <= 0) os << "features.window_hop_seconds is too small for the sample rate";
    else if (f.window_hop_samples() > f.window_samples()) os << "features.window_hop_seconds must not exceed window_seconds";
    else if (!fft::is_power_of_two(f.n_fft)) os << "features.n_fft must be a power of two (got " << f.n_fft << ")";
    else if (f.hop_length <= 0) os << "features.hop_length must be positive";
    else if (f.n_mels < 1) os << "features.n_mels must be at least 1";
    else if (f.fmin_hz < 0.0f || f.fmin_hz >= f.fmax_hz) os << "features.fmin_hz must be in [0, fmax_hz)";
    else if (f.fmax_hz > 0.5f * static_cast<float>(f.sample_rate)) os << "features.fmax_hz exceeds Nyquist";
    else if (f.top_db <= 0.0f) os << "features.top_db must be positive";
    else if (!(cfg.detection.threshold >= 0.0f && cfg.detection.threshold <= 1.0f)) os << "detection.threshold must be in [0, 1]";
    else if (cfg.detection.cooldown_seconds < 0.0f) os << "detection.cooldown_seconds must not be negative";
    else if (cfg.detection.input_gain <= 0.0f) os << "detection.input_gain must be positive";
    else if (cfg.detection.silence_rms < 0.0f) os << "detection.silence_rms must not be negative";
    else if (cfg.catalog.sounds_dir.empty()) os << "catalog.sounds_dir is empty";
    else if (cfg.classifier.backend != "onnx" && cfg.classifier.backend != "onset")
        os << "classifier.backend must be \"onnx\" or \"onset\" (got \"" << cfg.classifier.backend << "\")";
    else if (cfg.classifier.onset.pre_max < 0 || cfg.classifier.onset.post_max < 1 ||
             cfg.classifier.onset.pre_avg < 0 || cfg.classifier.onset.post_avg < 1)
        os << "classifier.onset peak windows must be non-negative (post_max and post_avg at least 1)";
    else if (cfg.classifier.onset.wait < 0 || cfg.classifier.onset.min_peaks < 2)
        os << "classifier.onset.wait must not be negative and min_peaks must be at least 2";
    else if (cfg.server.port < 1 || cfg.server.port > 65535) os << "server.port must be in 1..65535";
    else if (cfg.server.io_threads < 1) os << "server.io_threads must be at least 1";
    else if (cfg.server.max_upload_bytes < 1) os << "server.max_upload_bytes must be positive";

    error = os.str();
    return error.empty();
}

} // namespace peckwatch
