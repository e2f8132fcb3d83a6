#include "nms.hpp"

#include <algorithm>

float iou(const Box& a, const Box& b) {
  const float x0 = std::max(a.left, b.left);
  const float y0 = std::max(a.top, b.top);
  const float x1 = std::min(a.right, b.right);
  const float y1 = std::min(a.bottom, b.bottom);

  const float inter = std::max(0.0f, x1 - x0) * std::max(0.0f, y1 - y0);
  const float uni = a.area() + b.area() - inter;
  return uni > 0.0f ? inter / uni : 0.0f;
}

std::vector<Detection> apply_nms(std::vector<Detection> detections, float iou_threshold) {
  if (detections.empty()) return {};

  std::stable_sort(detections.begin(), detections.end(),
                   [](const Detection& a, const Detection& b) { return a.confidence > b.confidence; });

  std::vector<Detection> kept;
  std::vector<bool> removed(detections.size(), false);
  for (size_t i = 0; i < detections.size(); ++i) {
    if (removed[i]) continue;
    kept.push_back(detections[i]);
    for (size_t j = i + 1; j < detections.size(); ++j) {
      if (removed[j]) continue;
      if (iou(detections[i].box, detections[j].box) > iou_threshold) removed[j] = true;
    }
  }
  return kept;
}
