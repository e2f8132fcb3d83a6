#include "detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace std::chrono;

namespace {

float elapsed_ms(Clock::time_point since) {
  return static_cast<float>(duration_cast<microseconds>(Clock::now() - since).count()) / 1000.0f;
}

}  // namespace

size_t element_count(const std::vector<int64_t>& shape) {
  size_t n = 1;
  for (int64_t d : shape) n *= static_cast<size_t>(std::max<int64_t>(1, d));
  return n;
}

const char* to_string(DetectStatus s) {
  switch (s) {
    case DetectStatus::Ok: return "ok";
    case DetectStatus::DecodeFailed: return "decode_failed";
    case DetectStatus::InferenceFailed: return "inference_failed";
  }
  return "unknown";
}

ObjectDetector::ObjectDetector(std::unique_ptr<InferenceInvoker> invoker,
                               std::unique_ptr<ImageCodec> codec, const DetectorConfig& config,
                               LabelMap labels)
    : invoker_(std::move(invoker)),
      codec_(std::move(codec)),
      config_(config),
      labels_(std::move(labels)) {
  if (!invoker_ || !codec_) {
    throw ModelLoadError("detector requires an inference invoker and an image codec");
  }

  input_ = invoker_->input();
  if (input_.width <= 0 || input_.height <= 0 || input_.channels != 3) {
    throw ModelLoadError("invalid model input geometry " + std::to_string(input_.height) + "x" +
                         std::to_string(input_.width) + "x" + std::to_string(input_.channels));
  }

  outputs_ = invoker_->outputs();
  for (size_t i = 0; i < outputs_.size(); ++i) {
    spdlog::info("Model output {}: name='{}' shape={}", i, outputs_[i].name,
                 shape_to_string(outputs_[i].shape));
  }

  SchemaResolution res = resolve_schema(outputs_);
  if (!res.ok) {
    throw ModelLoadError("model '" + invoker_->name() + "' is unusable for detection: " + res.error);
  }
  schema_ = res.schema;
  match_ = res.match;
  allocateBuffers();

  spdlog::info("Detector ready: input [1,{},{},3], {} ({})", input_.height, input_.width,
               describe(schema_), match_ == SchemaMatch::ByName ? "by name" : "by shape");
}

void ObjectDetector::allocateBuffers() {
  buffers_.clear();
  for (int slot : {schema_.boxes, schema_.classes, schema_.scores, schema_.count}) {
    buffers_[slot] = std::vector<float>(element_count(outputs_[static_cast<size_t>(slot)].shape), 0.0f);
  }
}

RawDetectionTensors ObjectDetector::collectOutputs() const {
  RawDetectionTensors raw;
  raw.boxes = buffers_.at(schema_.boxes);
  raw.classes = buffers_.at(schema_.classes);
  raw.scores = buffers_.at(schema_.scores);
  const auto& count = buffers_.at(schema_.count);
  raw.count = count.empty() ? 0.0f : count.front();
  return raw;
}

DetectStatus ObjectDetector::detect(const ImagePayload& payload, DetectionSet& out,
                                    DetectTimings* timings) {
  auto t0 = Clock::now();

  RgbImage original;
  if (!codec_->decode(payload, original) || original.empty()) {
    spdlog::warn("Failed to decode {}-byte frame for detection", payload.size());
    return DetectStatus::DecodeFailed;
  }

  RgbImage resized;
  if (!codec_->resize(original, input_.width, input_.height, resized) ||
      resized.pixels.size() != input_.byte_size()) {
    spdlog::warn("Failed to resize {}x{} frame to model input {}x{}", original.width,
                 original.height, input_.width, input_.height);
    return DetectStatus::DecodeFailed;
  }
  const float decode_ms = elapsed_ms(t0);

  for (auto& kv : buffers_) std::fill(kv.second.begin(), kv.second.end(), 0.0f);

  auto t1 = Clock::now();
  if (!invoker_->invoke(resized.pixels, buffers_)) {
    spdlog::warn("Inference call failed on {}", invoker_->name());
    return DetectStatus::InferenceFailed;
  }
  const float infer_ms = elapsed_ms(t1);

  auto t2 = Clock::now();
  RawDetectionTensors raw = collectOutputs();
  std::vector<Detection> candidates =
      decode_detections(raw, schema_, original.width, original.height,
                        config_.confidence_threshold, labels_);

  out.detections = apply_nms(std::move(candidates), config_.nms_threshold);
  out.image_width = original.width;
  out.image_height = original.height;

  if (timings) {
    timings->decode_ms = decode_ms;
    timings->infer_ms = infer_ms;
    timings->post_ms = elapsed_ms(t2);
    timings->raw_count = clamp_detection_count(raw.count, schema_.max_detections);
  }

  spdlog::debug("Detection: {} objects after NMS ({} raw), decode={:.2f}ms infer={:.2f}ms",
                out.detections.size(), clamp_detection_count(raw.count, schema_.max_detections),
                decode_ms, infer_ms);
  return DetectStatus::Ok;
}
