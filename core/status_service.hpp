#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "engine_config.hpp"
#include "sound_catalog.hpp"
#include "stats_aggregator.hpp"

namespace peckwatch {

struct StatusSnapshot {
    bool ready = false;
    bool classifier_loaded = false;
    bool catalog_loaded = false;
    std::vector<std::string> categories;
    size_t total_assets = 0;
    int sample_rate = 0;
    float threshold = 0.0f;
    float cooldown_seconds = 0.0f;
    float window_seconds = 0.0f;
    std::string default_mode;
    TotalsSnapshot totals;
    std::vector<std::string> problems;  // startup errors, empty when ready
};

// Read-only view over the engine's parts, safe to query from any thread.
class StatusService {
public:
    StatusService(const EngineConfig& config, const SoundCatalog& catalog, const StatsAggregator& stats);

    void set_classifier(const IClassifier* classifier) { classifier_ = classifier; }
    void set_problems(const std::vector<std::string>& problems);

    StatusSnapshot snapshot() const;
    bool ready() const;

private:
    const EngineConfig& config_;
    const SoundCatalog& catalog_;
    const StatsAggregator& stats_;
    const IClassifier* classifier_ = nullptr;

    mutable std::mutex mutex_;
    std::vector<std::string> problems_;
    bool started_ = false;
};

} // namespace peckwatch
