#include "classifier.hpp"

#include <onnxruntime_cxx_api.h>

#include <cmath>
#include <iostream>
#include <sstream>
#include <vector>

namespace peckwatch {

class OnnxClassifier : public IClassifier {
public:
    explicit OnnxClassifier(const ClassifierConfig& cfg)
        : config(cfg),
          memory_info(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {}

    bool load(std::string& error) override {
        session.reset();
        try {
            env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "peckwatch");
            Ort::SessionOptions options;
            options.SetIntraOpNumThreads(config.intra_op_threads > 0 ? config.intra_op_threads : 1);
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            auto s = std::make_unique<Ort::Session>(*env, config.model_path.c_str(), options);

            if (s->GetInputCount() != 1 || s->GetOutputCount() < 1) {
                std::ostringstream os;
                os << "model " << config.model_path << " has " << s->GetInputCount()
                   << " inputs and " << s->GetOutputCount() << " outputs, expected 1 and >= 1";
                error = os.str();
                return false;
            }

            Ort::AllocatorWithDefaultOptions allocator;
            input_name = s->GetInputNameAllocated(0, allocator).get();
            output_name = s->GetOutputNameAllocated(0, allocator).get();

            auto shape = s->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
            if (!setup_input_shape(shape, error)) return false;

            session = std::move(s);
        } catch (const Ort::Exception& e) {
            error = std::string("cannot load model ") + config.model_path + ": " + e.what();
            return false;
        }

        std::cout << "Classifier loaded: " << describe() << std::endl;
        return true;
    }

    bool is_loaded() const override { return session != nullptr; }

    bool predict(const FeatureTensor& tensor, float& probability, std::string& error) const override {
        if (!session) {
            error = "classifier not loaded";
            return false;
        }
        if (!tensor.has_shape(config.n_mels, config.n_frames)) {
            std::ostringstream os;
            os << "tensor shape " << tensor.n_mels << "x" << tensor.n_frames
               << " does not match model input " << config.n_mels << "x" << config.n_frames;
            error = os.str();
            return false;
        }

        try {
            // Ort only reads the buffer
            Ort::Value input = Ort::Value::CreateTensor<float>(
                memory_info, const_cast<float*>(tensor.data.data()), tensor.data.size(),
                input_shape.data(), input_shape.size());
            const char* in_names[] = {input_name.c_str()};
            const char* out_names[] = {output_name.c_str()};
            auto outputs = session->Run(Ort::RunOptions{nullptr}, in_names, &input, 1, out_names, 1);
            if (outputs.empty() || !outputs[0].IsTensor()) {
                error = "model produced no tensor output";
                return false;
            }
            const size_t count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
            if (count < 1) {
                error = "model produced an empty output";
                return false;
            }
            const float* out = outputs[0].GetTensorData<float>();
            // sigmoid head: one value; softmax head: [negative, positive]
            float p = count >= 2 ? out[1] : out[0];
            if (!std::isfinite(p)) p = 0.0f;
            probability = p < 0.0f ? 0.0f : (p > 1.0f ? 1.0f : p);
            return true;
        } catch (const Ort::Exception& e) {
            error = std::string("inference failed: ") + e.what();
            return false;
        }
    }

    const ClassifierConfig& get_config() const override { return config; }

    std::string describe() const override {
        std::ostringstream os;
        os << "onnx " << config.model_path << " input '" << input_name << "' [";
        for (size_t i = 0; i < input_shape.size(); ++i) os << (i ? "," : "") << input_shape[i];
        os << "]";
        return os.str();
    }

private:
    ClassifierConfig config;
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::Session> session;
    Ort::MemoryInfo memory_info;
    std::string input_name;
    std::string output_name;
    std::vector<int64_t> input_shape;

    // Accepts [N, mels, frames, 1] (Keras channels-last) or [N, mels, frames];
    // dynamic dimensions (-1) are bound to the configured tensor shape.
    bool setup_input_shape(const std::vector<int64_t>& shape, std::string& error) {
        auto matches = [](int64_t dim, int64_t want) { return dim < 0 || dim == want; };
        const int64_t mels = config.n_mels;
        const int64_t frames = config.n_frames;
        if (shape.size() == 4 && matches(shape[0], 1) && matches(shape[1], mels) &&
            matches(shape[2], frames) && matches(shape[3], 1)) {
            input_shape = {1, mels, frames, 1};
            return true;
        }
        if (shape.size() == 3 && matches(shape[0], 1) && matches(shape[1], mels) && matches(shape[2], frames)) {
            input_shape = {1, mels, frames};
            return true;
        }
        std::ostringstream os;
        os << "model input shape [";
        for (size_t i = 0; i < shape.size(); ++i) os << (i ? "," : "") << shape[i];
        os << "] is incompatible with features " << mels << "x" << frames;
        error = os.str();
        return false;
    }
};

std::unique_ptr<IClassifier> createOnnxClassifier(const ClassifierConfig& config) {
    return std::make_unique<OnnxClassifier>(config);
}

} // namespace peckwatch
