#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

// One complete encoded still image (JPEG) cut out of the multipart stream.
using ImagePayload = std::vector<uint8_t>;

constexpr size_t kMaxStreamBufferBytes = 3 * 1024 * 1024;
constexpr size_t kMinPayloadBytes = 500;
constexpr const char* kFrameBoundary = "--frame\r\nContent-Type: image/jpeg\r\n\r\n";

// Axis-aligned box in pixel space, edges rather than origin + size.
struct Box {
  float left{0}, top{0}, right{0}, bottom{0};

  float width() const { return right - left; }
  float height() const { return bottom - top; }
  float area() const { return width() * height(); }
  bool valid() const { return right > left && bottom > top; }
};

inline bool operator==(const Box& a, const Box& b) {
  return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
}

struct Detection {
  Box box;
  int class_id{-1};
  std::string label;
  float confidence{0.0f};
};

inline bool operator==(const Detection& a, const Detection& b) {
  return a.box == b.box && a.class_id == b.class_id && a.label == b.label &&
         a.confidence == b.confidence;
}

// Surviving detections for one frame, with the size of the image they refer to.
struct DetectionSet {
  std::vector<Detection> detections;
  int image_width{0};
  int image_height{0};
  uint64_t frame_id{0};

  bool empty() const { return detections.empty(); }
};

// Decoded RGB pixels, 3 bytes per pixel, row-major, no padding.
struct RgbImage {
  int width{0};
  int height{0};
  std::vector<uint8_t> pixels;

  bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};
