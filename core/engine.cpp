#include "engine.hpp"
#include "engine_config_io.hpp"
#include "pcm.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>

namespace peckwatch {

static double steady_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

Engine::Engine(const EngineConfig& config, std::unique_ptr<IClassifier> classifier)
    : config_(config),
      classifier_(std::move(classifier)),
      catalog_(config_.catalog),
      status_(config_, catalog_, stats_),
      clock_(steady_seconds) {
    sync_classifier_shape(config_);
    status_.set_classifier(classifier_.get());
}

Engine::~Engine() = default;

bool Engine::start(std::vector<std::string>& errors) {
    std::string err;
    bool config_ok = validate_engine_config(config_, err);
    if (!config_ok) errors.push_back("invalid configuration: " + err);

    if (!parse_reaction_mode(config_.catalog.default_mode, default_mode_)) {
        errors.push_back("invalid configuration: unknown catalog.default_mode '" + config_.catalog.default_mode + "'");
        default_mode_ = ReactionMode::Predators;
    }

    if (config_ok) extractor_ = std::make_unique<dsp::FeatureExtractor>(config_.features);

    err.clear();
    if (!catalog_.scan(err)) {
        errors.push_back(err);
    } else if (catalog_.total_assets() == 0) {
        errors.push_back("no playable sounds under " + config_.catalog.sounds_dir);
    } else {
        std::cout << "Sound catalog: " << catalog_.categories().size() << " categories, "
                  << catalog_.total_assets() << " sounds" << std::endl;
    }

    if (!classifier_) {
        errors.push_back("no classifier for backend '" + config_.classifier.backend + "'");
    } else {
        const ClassifierConfig& cc = classifier_->get_config();
        if (cc.n_mels != config_.classifier.n_mels || cc.n_frames != config_.classifier.n_frames) {
            std::ostringstream os;
            os << "classifier expects " << cc.n_mels << "x" << cc.n_frames << " features, extractor produces "
               << config_.classifier.n_mels << "x" << config_.classifier.n_frames;
            errors.push_back(os.str());
        } else {
            err.clear();
            if (!classifier_->load(err)) errors.push_back(err);
        }
    }

    status_.set_problems(errors);
    return ready();
}

uint32_t Engine::next_seed() {
    if (fixed_seed_.load()) return seed_.fetch_add(1);
    std::random_device rd;
    return rd();
}

std::shared_ptr<Session> Engine::open_session(SessionCallbacks callbacks, Status& status) {
    if (!ready() || !extractor_) {
        status = Status::NotReady;
        return nullptr;
    }
    SessionResources res;
    res.config = &config_;
    res.extractor = extractor_.get();
    res.classifier = classifier_.get();
    res.catalog = &catalog_;

    auto stats = stats_.open_session(default_mode_, clock_());
    status = Status::Ok;
    return std::make_shared<Session>(res, std::move(stats), std::move(callbacks), clock_, next_seed());
}

void Engine::close_session(const Session& session) {
    stats_.close_session(session.id());
}

Status Engine::analyze_clip(const std::vector<float>& samples, ClipAnalysis& out, std::string& error) const {
    if (!ready() || !extractor_) {
        error = "detector is not ready";
        return Status::NotReady;
    }
    const FeatureConfig& fc = config_.features;
    const size_t window = static_cast<size_t>(fc.window_samples());
    const size_t hop = static_cast<size_t>(fc.window_hop_samples());
    const size_t n = samples.size();

    out = ClipAnalysis();
    out.duration_seconds = static_cast<double>(n) / fc.sample_rate;
    const size_t count = n <= window ? 1 : 1 + (n - window + hop - 1) / hop;

    std::vector<float> buf(window);
    FeatureTensor tensor;
    for (size_t w = 0; w < count; ++w) {
        const size_t start = w * hop;
        const size_t take = start < n ? std::min(window, n - start) : 0;
        std::fill(buf.begin(), buf.end(), 0.0f);
        std::copy(samples.begin() + start, samples.begin() + start + take, buf.begin());

        float p = 0.0f;
        if (dsp::rms(buf.data(), static_cast<int>(window)) >= config_.detection.silence_rms) {
            Status s = extractor_->extract(buf, tensor);
            if (!ok(s)) {
                error = "window could not be converted to features";
                return s;
            }
            if (!classifier_->predict(tensor, p, error)) return Status::InferenceError;
            if (!std::isfinite(p)) p = 0.0f;
            p = std::clamp(p, 0.0f, 1.0f);
        }
        out.confidences.push_back(p);
        out.probability = std::max(out.probability, p);
    }
    out.windows = static_cast<int>(count);
    out.detected = out.probability >= config_.detection.threshold;
    return Status::Ok;
}

} // namespace peckwatch
