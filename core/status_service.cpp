#include "status_service.hpp"

namespace peckwatch {

StatusService::StatusService(const EngineConfig& config, const SoundCatalog& catalog, const StatsAggregator& stats)
    : config_(config), catalog_(catalog), stats_(stats) {}

void StatusService::set_problems(const std::vector<std::string>& problems) {
    std::lock_guard<std::mutex> lock(mutex_);
    problems_ = problems;
    started_ = true;
}

bool StatusService::ready() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || !problems_.empty()) return false;
    }
    return classifier_ && classifier_->is_loaded() && catalog_.loaded() && catalog_.total_assets() > 0;
}

StatusSnapshot StatusService::snapshot() const {
    StatusSnapshot s;
    s.classifier_loaded = classifier_ && classifier_->is_loaded();
    s.catalog_loaded = catalog_.loaded();
    s.categories = catalog_.categories();
    s.total_assets = catalog_.total_assets();
    s.sample_rate = config_.features.sample_rate;
    s.threshold = config_.detection.threshold;
    s.cooldown_seconds = config_.detection.cooldown_seconds;
    s.window_seconds = config_.features.window_seconds;
    s.default_mode = config_.catalog.default_mode;
    s.totals = stats_.totals();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.problems = problems_;
    }
    s.ready = ready();
    return s;
}

} // namespace peckwatch
