#include "classifier.hpp"

namespace peckwatch {

std::unique_ptr<IClassifier> createClassifier(const ClassifierConfig& config) {
    if (config.backend == "onset") return createOnsetClassifier(config);
    if (config.backend == "onnx") return createOnnxClassifier(config);
    return nullptr;
}

} // namespace peckwatch
