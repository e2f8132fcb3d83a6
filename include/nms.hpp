#pragma once
#include <vector>

#include "types.hpp"

constexpr float kDefaultNmsThreshold = 0.4f;

// Intersection over union; 0 for disjoint boxes or a zero-area union.
float iou(const Box& a, const Box& b);

// Greedy class-agnostic suppression. Result is sorted by descending confidence.
std::vector<Detection> apply_nms(std::vector<Detection> detections,
                                 float iou_threshold = kDefaultNmsThreshold);
