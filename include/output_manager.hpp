#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "display_mapper.hpp"
#include "frame_store.hpp"
#include "metrics.hpp"
#include "util.hpp"

// Draws the latest frame and its detections onto a fixed-size canvas and
// optionally shows it in a window; logs a performance summary periodically.
class OutputManager {
public:
  OutputManager(const DisplayConfig& display, const LoggingConfig& logging, MetricsRegistry& m);
  ~OutputManager();

  // Renders one display tick. Returns false when the window was closed.
  bool tick(const DisplaySnapshot& snap, bool detection_on);

  cv::Mat render(const DisplaySnapshot& snap, bool detection_on);
  void logPerformanceSummary(bool force = false);

  static cv::Scalar colorFor(const RenderInstruction& ri);
  static SizeF measureLabel(const std::string& text);

private:
  DisplayConfig display_;
  LoggingConfig logging_;
  MetricsRegistry& metrics_;

  uint64_t cached_frame_id_{0};
  cv::Mat cached_frame_;
  bool window_open_{false};
  std::chrono::steady_clock::time_point last_summary_;

  const cv::Mat& frameFor(const DisplaySnapshot& snap);
  void drawDetections(cv::Mat& canvas, const std::vector<RenderInstruction>& items);
  void drawStatus(cv::Mat& canvas, const DisplaySnapshot& snap, bool detection_on);
};
