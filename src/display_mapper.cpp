#include "display_mapper.hpp"

#include <algorithm>
#include <cmath>

#include "class_names.hpp"

ContainFit compute_contain_fit(SizeF image, SizeF canvas) {
  ContainFit fit;
  if (image.empty() || canvas.empty()) return fit;
  fit.scale = std::min(canvas.width / image.width, canvas.height / image.height);
  fit.offset_x = (canvas.width - image.width * fit.scale) / 2.0f;
  fit.offset_y = (canvas.height - image.height * fit.scale) / 2.0f;
  return fit;
}

std::string format_label(const Detection& det) {
  const int pct = static_cast<int>(std::lround(det.confidence * 100.0f));
  return det.label + " (" + std::to_string(pct) + "%)";
}

namespace {

float place_label_y(const Box& box, float label_h, float canvas_h) {
  float y = box.top - label_h - kLabelGap;
  if (y < 0.0f) y = box.bottom + kLabelGap;
  if (y + label_h > canvas_h) y = box.top - label_h - kLabelGap;
  if (y < 0.0f) y = 0.0f;
  return y;
}

float place_label_x(const Box& box, float label_w, float canvas_w) {
  float x = box.left;
  if (x + label_w > canvas_w) x = canvas_w - label_w;
  if (x < 0.0f) x = 0.0f;
  return x;
}

}  // namespace

std::vector<RenderInstruction> map_to_display(const DetectionSet& set, SizeF canvas,
                                              const LabelMeasure& measure) {
  std::vector<RenderInstruction> out;
  const SizeF image{static_cast<float>(set.image_width), static_cast<float>(set.image_height)};
  if (canvas.empty() || image.empty() || set.empty()) return out;

  const ContainFit fit = compute_contain_fit(image, canvas);
  out.reserve(set.detections.size());
  for (const auto& det : set.detections) {
    RenderInstruction ri;
    ri.box = fit.map(det.box);
    ri.label = format_label(det);
    ri.class_id = det.class_id;
    ri.synthetic_label = det.label == LabelMap::syntheticLabel(det.class_id);
    ri.label_size = measure ? measure(ri.label) : SizeF{};
    ri.label_x = place_label_x(ri.box, ri.label_size.width, canvas.width);
    ri.label_y = place_label_y(ri.box, ri.label_size.height, canvas.height);
    out.push_back(std::move(ri));
  }
  return out;
}
