#include <railtriage/nlp/onnx_text_model.hpp>
#include <railtriage/nlp/text_normalizer.hpp>
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace railtriage::nlp {

namespace {

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Leave a proper distribution untouched; softmax anything else (logits).
void ToDistribution(CategoryDistribution& scores) {
  float sum = 0.f;
  bool negative = false;
  for (float s : scores) {
    sum += s;
    negative = negative || s < 0.f;
  }
  if (!negative && std::fabs(sum - 1.f) < 1e-3f) return;

  const float max_score = *std::max_element(scores.begin(), scores.end());
  float z = 0.f;
  for (float& s : scores) {
    s = std::exp(s - max_score);
    z += s;
  }
  for (float& s : scores) s /= z;
}

}  // namespace

struct OnnxTextModel::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "railtriage"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  TextVectorizer vectorizer;
  std::string model_path;
  std::string input_name;
  std::string output_name;

  explicit Impl(TextVectorizer v) : vectorizer(std::move(v)) {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxTextModel::OnnxTextModel(std::string model_path,
                             TextVectorizer vectorizer,
                             std::string input_name,
                             std::string output_name)
    : impl_(std::make_unique<Impl>(std::move(vectorizer))) {
  impl_->model_path = std::move(model_path);
  impl_->session = Ort::Session(impl_->env, impl_->model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxTextModel: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxTextModel: model has no outputs");
  }
  impl_->input_name = input_name.empty()
                          ? std::string(impl_->session.GetInputNameAllocated(0, allocator).get())
                          : std::move(input_name);
  impl_->output_name = output_name.empty()
                           ? std::string(impl_->session.GetOutputNameAllocated(0, allocator).get())
                           : std::move(output_name);

  const auto in_shape = impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (in_shape.size() != 2u) {
    throw std::runtime_error("OnnxTextModel: expected 2D input [1, D]");
  }
  if (in_shape[1] > 0 && static_cast<std::size_t>(in_shape[1]) != impl_->vectorizer.dims()) {
    throw std::runtime_error("OnnxTextModel: model input width " + std::to_string(in_shape[1]) +
                             " does not match vector_dims " +
                             std::to_string(impl_->vectorizer.dims()));
  }
}

OnnxTextModel::~OnnxTextModel() = default;

std::string OnnxTextModel::name() const {
  return "onnx:" + std::filesystem::path(impl_->model_path).filename().string();
}

std::expected<CategoryDistribution, core::TriageError>
OnnxTextModel::predict(std::string_view normalized_text) {
  core::FeatureVector features = impl_->vectorizer.vectorize(tokenize(normalized_text));

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  const std::array<int64_t, 2> shape{1, static_cast<int64_t>(features.size())};
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, features.data(), features.size(), shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception& e) {
    spdlog::warn("OnnxTextModel: inference failed: {}", e.what());
    return std::unexpected(core::TriageError::ModelUnavailable);
  }

  if (outputs.size() != 1u) {
    return std::unexpected(core::TriageError::ModelUnavailable);
  }
  const auto out_info = outputs[0].GetTensorTypeAndShapeInfo();
  if (out_info.GetElementCount() != core::kCategoryCount) {
    spdlog::warn("OnnxTextModel: expected {} scores, got {}", core::kCategoryCount,
                 out_info.GetElementCount());
    return std::unexpected(core::TriageError::ModelUnavailable);
  }

  const float* data = outputs[0].GetTensorData<float>();
  CategoryDistribution dist{};
  std::copy(data, data + core::kCategoryCount, dist.begin());
  ToDistribution(dist);
  return dist;
}

void OnnxTextModel::warmup() {
  auto result = predict("warmup");
  if (!result) {
    spdlog::warn("OnnxTextModel: warmup inference failed ({})", core::to_string(result.error()));
  }
}

}  // namespace railtriage::nlp
