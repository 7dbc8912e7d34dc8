#pragma once

#include "engine_config.hpp"
#include <string>

namespace peckwatch {

// Keys absent from the file keep the values already in `cfg`. On failure
// `error` (when given) says whether the file could not be read or parsed.
bool load_engine_config(const std::string& path, EngineConfig& cfg, std::string* error = nullptr);
bool save_engine_config(const std::string& path, const EngineConfig& cfg);

// Parses the same JSON layout from memory (used by load_engine_config).
bool parse_engine_config(const std::string& json_text, EngineConfig& cfg, std::string* error = nullptr);

// Copies the feature geometry the classifier depends on into cfg.classifier.
void sync_classifier_shape(EngineConfig& cfg);

// Returns false and a human-readable reason for the first invalid field.
bool validate_engine_config(const EngineConfig& cfg, std::string& error);

}
