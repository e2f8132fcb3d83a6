#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "class_names.hpp"
#include "detection_decoder.hpp"
#include "image_codec.hpp"
#include "inference_invoker.hpp"
#include "model_schema.hpp"
#include "nms.hpp"
#include "types.hpp"

// The loaded model cannot be used for detection (schema not resolvable or bad
// input geometry). Detection stays off until a reload is attempted.
class ModelLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct DetectorConfig {
  std::string engine_path = "models/detect.engine";
  std::string labels_path;  // empty: built-in COCO labels
  float confidence_threshold = kDefaultConfidenceThreshold;
  float nms_threshold = kDefaultNmsThreshold;
  bool enabled = true;
};

enum class DetectStatus { Ok, DecodeFailed, InferenceFailed };

const char* to_string(DetectStatus s);

struct DetectTimings {
  float decode_ms{0};
  float infer_ms{0};
  float post_ms{0};
  int raw_count{0};
};

// Image payload -> DetectionSet. The output schema is resolved once, in the
// constructor, and reused for every call.
class ObjectDetector {
public:
  ObjectDetector(std::unique_ptr<InferenceInvoker> invoker, std::unique_ptr<ImageCodec> codec,
                 const DetectorConfig& config, LabelMap labels = LabelMap{});

  DetectStatus detect(const ImagePayload& payload, DetectionSet& out,
                      DetectTimings* timings = nullptr);

  const OutputSchema& schema() const { return schema_; }
  SchemaMatch schemaMatch() const { return match_; }
  const InputSpec& inputSpec() const { return input_; }
  const DetectorConfig& config() const { return config_; }
  std::string modelName() const { return invoker_->name(); }

private:
  std::unique_ptr<InferenceInvoker> invoker_;
  std::unique_ptr<ImageCodec> codec_;
  DetectorConfig config_;
  LabelMap labels_;

  InputSpec input_;
  std::vector<TensorDescriptor> outputs_;
  OutputSchema schema_;
  SchemaMatch match_{SchemaMatch::None};
  OutputBuffers buffers_;

  void allocateBuffers();
  RawDetectionTensors collectOutputs() const;
};
