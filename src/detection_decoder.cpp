#include "detection_decoder.hpp"

#include <algorithm>
#include <cmath>

int clamp_detection_count(float count, int max_detections) {
  const int max = std::max(0, max_detections);
  // Clamp while still a float; casting an out-of-range float to int is undefined.
  if (!(count > 0.0f)) return 0;
  if (count >= static_cast<float>(max)) return max;
  return static_cast<int>(count);
}

std::vector<Detection> decode_detections(const RawDetectionTensors& raw, const OutputSchema& schema,
                                         int image_width, int image_height, float threshold,
                                         const LabelMap& labels) {
  std::vector<Detection> detections;
  if (image_width <= 0 || image_height <= 0) return detections;

  const float w = static_cast<float>(image_width);
  const float h = static_cast<float>(image_height);
  const size_t n = static_cast<size_t>(clamp_detection_count(raw.count, schema.max_detections));

  for (size_t i = 0; i < n; ++i) {
    if (i >= raw.scores.size() || i >= raw.classes.size() || (i * 4 + 3) >= raw.boxes.size()) {
      break;
    }

    const float score = raw.scores[i];
    if (!(score > threshold)) continue;

    const float* b = &raw.boxes[i * 4];
    Box box;
    box.top = std::clamp(b[0] * h, 0.0f, h);
    box.left = std::clamp(b[1] * w, 0.0f, w);
    box.bottom = std::clamp(b[2] * h, 0.0f, h);
    box.right = std::clamp(b[3] * w, 0.0f, w);
    if (!box.valid()) continue;

    Detection det;
    det.box = box;
    det.class_id = static_cast<int>(std::lround(raw.classes[i]));
    det.label = labels.label(det.class_id);
    det.confidence = score;
    detections.push_back(std::move(det));
  }

  return detections;
}
