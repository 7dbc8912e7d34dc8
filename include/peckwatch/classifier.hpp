#pragma once

#include <memory>
#include <string>

#include "engine_config.hpp"
#include "feature_tensor.hpp"

namespace peckwatch {

// Binary woodpecker classifier: feature tensor -> probability in [0, 1].
// Loaded once at startup and immutable afterwards; predict() must be safe
// to call from several session threads at once.
class IClassifier {
public:
    virtual ~IClassifier() = default;

    // Loads the model artifact. On failure returns false and fills `error`.
    virtual bool load(std::string& error) = 0;
    virtual bool is_loaded() const = 0;

    // Returns false on a per-window failure (shape mismatch, runtime
    // error); `error` then describes it and `probability` is untouched.
    virtual bool predict(const FeatureTensor& tensor, float& probability, std::string& error) const = 0;

    virtual const ClassifierConfig& get_config() const = 0;
    virtual std::string describe() const = 0;
};

// Factory that returns the backend named by config.backend ("onnx" or
// "onset"); nullptr for an unknown name.
std::unique_ptr<IClassifier> createClassifier(const ClassifierConfig& config);

// ONNX Runtime model (platform/onnx)
std::unique_ptr<IClassifier> createOnnxClassifier(const ClassifierConfig& config);
// Drumming/foraging onset detector, needs no model file (platform/onset)
std::unique_ptr<IClassifier> createOnsetClassifier(const ClassifierConfig& config);

} // namespace peckwatch
