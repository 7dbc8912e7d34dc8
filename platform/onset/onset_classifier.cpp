#include "classifier.hpp"
#include "onset_detector.hpp"

#include <sstream>

namespace peckwatch {

// Scores a window by its hit pattern instead of a trained model: regular
// fast drumming or slower foraging taps map to a confidence, anything
// else to 0.
class OnsetClassifier : public IClassifier {
public:
    explicit OnsetClassifier(const ClassifierConfig& cfg)
        : config(cfg),
          detector(cfg.onset, cfg.sample_rate, cfg.n_fft, cfg.hop_length, cfg.window_samples) {}

    bool load(std::string& error) override {
        if (config.sample_rate <= 0 || config.hop_length <= 0 || config.window_samples <= 0) {
            error = "onset classifier needs a positive sample rate, hop length and window";
            return false;
        }
        if (config.n_frames < 3) {
            std::ostringstream os;
            os << "onset classifier needs at least 3 frames per window, got " << config.n_frames;
            error = os.str();
            return false;
        }
        loaded = true;
        return true;
    }

    bool is_loaded() const override { return loaded; }

    bool predict(const FeatureTensor& tensor, float& probability, std::string& error) const override {
        if (!loaded) {
            error = "classifier not loaded";
            return false;
        }
        if (!tensor.has_shape(config.n_mels, config.n_frames)) {
            std::ostringstream os;
            os << "tensor shape " << tensor.n_mels << "x" << tensor.n_frames
               << " does not match " << config.n_mels << "x" << config.n_frames;
            error = os.str();
            return false;
        }
        probability = detector.analyze(tensor).confidence;
        return true;
    }

    const ClassifierConfig& get_config() const override { return config; }

    std::string describe() const override {
        const OnsetConfig& o = config.onset;
        std::ostringstream os;
        os << "onset drumming " << o.drum_rate_min << "-" << o.drum_rate_max << " hits/s, foraging "
           << o.forage_rate_min << "-" << o.forage_rate_max << " hits/s, min rms " << o.min_rms;
        return os.str();
    }

private:
    ClassifierConfig config;
    dsp::OnsetDetector detector;
    bool loaded = false;
};

std::unique_ptr<IClassifier> createOnsetClassifier(const ClassifierConfig& config) {
    return std::make_unique<OnsetClassifier>(config);
}

} // namespace peckwatch
