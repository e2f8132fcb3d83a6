#pragma once
#include <functional>
#include <string>
#include <vector>

#include "types.hpp"

struct SizeF {
  float width{0};
  float height{0};

  bool empty() const { return !(width > 0.0f) || !(height > 0.0f); }
};

// Aspect-preserving, centered fit of an image inside a canvas.
struct ContainFit {
  float scale{0};
  float offset_x{0};
  float offset_y{0};

  float map_x(float x) const { return x * scale + offset_x; }
  float map_y(float y) const { return y * scale + offset_y; }
  Box map(const Box& b) const { return {map_x(b.left), map_y(b.top), map_x(b.right), map_y(b.bottom)}; }
};

ContainFit compute_contain_fit(SizeF image, SizeF canvas);

// What the renderer needs to draw one detection on the canvas.
struct RenderInstruction {
  Box box;
  std::string label;
  float label_x{0};
  float label_y{0};  // top edge of the label
  SizeF label_size;
  int class_id{-1};
  bool synthetic_label{false};
};

using LabelMeasure = std::function<SizeF(const std::string&)>;

constexpr float kLabelGap = 3.0f;

std::string format_label(const Detection& det);

// Maps a detection set onto a letterboxed canvas. Empty when the canvas or the
// image has no area, or there is nothing to draw.
std::vector<RenderInstruction> map_to_display(const DetectionSet& set, SizeF canvas,
                                              const LabelMeasure& measure);
