#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "engine_config.hpp"

namespace peckwatch {

struct CommandLine {
    std::string config_path = "peckwatch.json";
    bool config_given = false;        // --config was passed; a missing file is then an error
    std::string write_config_path;    // --write-config <path>
    bool help = false;
    // flag -> value, applied over the file in order
    std::vector<std::pair<std::string, std::string>> overrides;
};

bool parse_command_line(int argc, char* argv[], CommandLine& out, std::string& error);

// Applies --port, --backend, --model, --sounds, --threshold, --cooldown, --gain,
// --threads and --log-level to `cfg`.
bool apply_overrides(const CommandLine& cl, EngineConfig& cfg, std::string& error);

// Defaults, then the config file, then the overrides. A missing default
// config file is not an error; a missing --config file is.
bool load_effective_config(const CommandLine& cl, EngineConfig& cfg, std::string& error);

void print_usage(const char* argv0, std::ostream& os);

} // namespace peckwatch
