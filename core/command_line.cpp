#include "command_line.hpp"
#include "engine_config_io.hpp"

#include <cstdlib>
#include <filesystem>

namespace peckwatch {

static const char* const kValueFlags[] = {
    "--port", "--backend", "--model", "--sounds", "--threshold", "--cooldown", "--gain", "--threads", "--log-level",
};

static bool to_int(const std::string& s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

static bool to_float(const std::string& s, float& out) {
    char* end = nullptr;
    float v = std::strtof(s.c_str(), &end);
    if (s.empty() || *end != '\0') return false;
    out = v;
    return true;
}

bool parse_command_line(int argc, char* argv[], CommandLine& out, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            out.help = true;
            continue;
        }
        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return false;
        }
        if (arg == "--config") {
            out.config_path = argv[++i];
            out.config_given = true;
            continue;
        }
        if (arg == "--write-config") {
            out.write_config_path = argv[++i];
            continue;
        }
        bool known = false;
        for (const char* f : kValueFlags) known = known || arg == f;
        if (!known) {
            error = "unknown option " + arg;
            return false;
        }
        out.overrides.emplace_back(arg, argv[++i]);
    }
    return true;
}

bool apply_overrides(const CommandLine& cl, EngineConfig& cfg, std::string& error) {
    for (const auto& kv : cl.overrides) {
        const std::string& flag = kv.first;
        const std::string& value = kv.second;
        bool parsed = true;
        if (flag == "--port") parsed = to_int(value, cfg.server.port);
        else if (flag == "--threads") parsed = to_int(value, cfg.server.io_threads);
        else if (flag == "--backend") cfg.classifier.backend = value;
        else if (flag == "--model") cfg.classifier.model_path = value;
        else if (flag == "--sounds") cfg.catalog.sounds_dir = value;
        else if (flag == "--log-level") cfg.server.log_level = value;
        else if (flag == "--threshold") parsed = to_float(value, cfg.detection.threshold);
        else if (flag == "--cooldown") parsed = to_float(value, cfg.detection.cooldown_seconds);
        else if (flag == "--gain") parsed = to_float(value, cfg.detection.input_gain);
        if (!parsed) {
            error = "invalid value '" + value + "' for " + flag;
            return false;
        }
    }
    return true;
}

bool load_effective_config(const CommandLine& cl, EngineConfig& cfg, std::string& error) {
    std::error_code ec;
    if (std::filesystem::exists(cl.config_path, ec)) {
        if (!load_engine_config(cl.config_path, cfg, &error)) return false;
    } else if (cl.config_given) {
        error = "config file not found: " + cl.config_path;
        return false;
    }
    if (!apply_overrides(cl, cfg, error)) return false;
    sync_classifier_shape(cfg);
    return true;
}

void print_usage(const char* argv0, std::ostream& os) {
    os << "Usage: " << argv0 << " [options]\n"
       << "  --config <file>        JSON configuration (default: peckwatch.json)\n"
       << "  --port <n>             Listen port (default: 8000)\n"
       << "  --backend <name>       Classifier: onnx or onset (default: onnx)\n"
       << "  --model <file>         ONNX model (default: woodpecker_model.onnx)\n"
       << "  --sounds <dir>         Reaction sound root (default: static/sounds)\n"
       << "  --threshold <0..1>     Detection threshold (default: 0.75)\n"
       << "  --cooldown <seconds>   Minimum time between reactions (default: 3)\n"
       << "  --gain <factor>        Input gain applied to decoded audio (default: 1)\n"
       << "  --threads <n>          Event loop threads (default: 4)\n"
       << "  --log-level <level>    trace, debug, info, warn or error (default: info)\n"
       << "  --write-config <file>  Write the effective configuration and exit\n"
       << "  --help                 Show this help\n";
}

} // namespace peckwatch
