#pragma once
#include <vector>

#include "class_names.hpp"
#include "model_schema.hpp"
#include "types.hpp"

constexpr float kDefaultConfidenceThreshold = 0.45f;

// Output of a single inference call, already split by role.
// boxes holds max_detections * 4 floats: yMin, xMin, yMax, xMax in [0,1].
struct RawDetectionTensors {
  std::vector<float> boxes;
  std::vector<float> classes;
  std::vector<float> scores;
  float count{0};
};

// Number of candidates to inspect: count truncated and clamped to [0, max].
int clamp_detection_count(float count, int max_detections);

// Converts raw tensors to pixel-space detections of the original image. Keeps
// the model's own ordering; no suppression is applied here.
std::vector<Detection> decode_detections(const RawDetectionTensors& raw, const OutputSchema& schema,
                                         int image_width, int image_height,
                                         float threshold = kDefaultConfidenceThreshold,
                                         const LabelMap& labels = LabelMap{});
