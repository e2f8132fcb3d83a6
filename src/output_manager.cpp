#include "output_manager.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

#include "opencv_codec.hpp"

namespace {

constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
constexpr double kFontScale = 0.45;
constexpr int kFontThickness = 1;

}  // namespace

OutputManager::OutputManager(const DisplayConfig& display, const LoggingConfig& logging,
                             MetricsRegistry& m)
    : display_(display), logging_(logging), metrics_(m),
      last_summary_(std::chrono::steady_clock::now()) {
  if (display_.enable_window) {
    cv::namedWindow(display_.window_name, cv::WINDOW_AUTOSIZE);
    window_open_ = true;
    spdlog::info("Display window '{}' {}x{} @ {}ms refresh", display_.window_name,
                 display_.canvas_width, display_.canvas_height, display_.refresh_ms);
  } else {
    spdlog::info("Display window disabled - headless mode");
  }
}

OutputManager::~OutputManager() {
  if (window_open_) cv::destroyWindow(display_.window_name);
  logPerformanceSummary(true);
}

SizeF OutputManager::measureLabel(const std::string& text) {
  int baseline = 0;
  cv::Size s = cv::getTextSize(" " + text + " ", kFont, kFontScale, kFontThickness, &baseline);
  return {static_cast<float>(s.width), static_cast<float>(s.height + baseline + 2)};
}

cv::Scalar OutputManager::colorFor(const RenderInstruction& ri) {
  if (ri.synthetic_label) return cv::Scalar(64, 171, 255);  // orange
  if (ri.label.rfind("person", 0) == 0) return cv::Scalar(82, 82, 255);  // red
  return cv::Scalar(118, 230, 0);  // green
}

const cv::Mat& OutputManager::frameFor(const DisplaySnapshot& snap) {
  if (!snap.frame) {
    cached_frame_.release();
    cached_frame_id_ = 0;
  } else if (snap.frame_id != cached_frame_id_) {
    cv::Mat decoded = decode_bgr(*snap.frame);
    if (decoded.empty()) {
      spdlog::debug("Frame {} could not be decoded for display", snap.frame_id);
    } else {
      cached_frame_ = decoded;
    }
    cached_frame_id_ = snap.frame_id;
  }
  return cached_frame_;
}

cv::Mat OutputManager::render(const DisplaySnapshot& snap, bool detection_on) {
  const SizeF canvas_size{static_cast<float>(display_.canvas_width),
                          static_cast<float>(display_.canvas_height)};
  cv::Mat canvas = cv::Mat::zeros(display_.canvas_height, display_.canvas_width, CV_8UC3);

  const cv::Mat& frame = frameFor(snap);
  if (!frame.empty()) {
    ContainFit fit = compute_contain_fit(
        {static_cast<float>(frame.cols), static_cast<float>(frame.rows)}, canvas_size);
    const int w = std::max(1, static_cast<int>(frame.cols * fit.scale));
    const int h = std::max(1, static_cast<int>(frame.rows * fit.scale));
    cv::Rect roi(static_cast<int>(fit.offset_x), static_cast<int>(fit.offset_y), w, h);
    roi &= cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.area() > 0) {
      cv::Mat scaled;
      cv::resize(frame, scaled, roi.size());
      scaled.copyTo(canvas(roi));
    }

    if (detection_on) {
      drawDetections(canvas, map_to_display(snap.detections, canvas_size, &measureLabel));
    }
  }

  drawStatus(canvas, snap, detection_on);
  return canvas;
}

void OutputManager::drawDetections(cv::Mat& canvas, const std::vector<RenderInstruction>& items) {
  for (const auto& ri : items) {
    const cv::Scalar color = colorFor(ri);
    cv::rectangle(canvas, cv::Point2f(ri.box.left, ri.box.top),
                  cv::Point2f(ri.box.right, ri.box.bottom), color, 2);

    cv::Rect bg(static_cast<int>(ri.label_x), static_cast<int>(ri.label_y),
                static_cast<int>(ri.label_size.width), static_cast<int>(ri.label_size.height));
    bg &= cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (bg.area() > 0) {
      cv::Mat region = canvas(bg);
      cv::Mat fill(region.size(), region.type(), color);
      cv::addWeighted(fill, 0.7, region, 0.3, 0, region);
    }

    const int baseline_y = static_cast<int>(ri.label_y + ri.label_size.height) - 4;
    cv::putText(canvas, " " + ri.label + " ", cv::Point(static_cast<int>(ri.label_x), baseline_y),
                kFont, kFontScale, cv::Scalar(0, 0, 0), kFontThickness, cv::LINE_AA);
  }
}

void OutputManager::drawStatus(cv::Mat& canvas, const DisplaySnapshot& snap, bool detection_on) {
  std::string text;
  if (snap.status.state == StreamState::Active) {
    text = fmt::format("Frame {} | Detection {} | {} objects", snap.frame_id,
                       detection_on ? "ON" : "OFF", snap.detections.detections.size());
  } else {
    text = snap.status.message.empty() ? std::string("Stream inactive") : snap.status.message;
  }
  cv::putText(canvas, text, cv::Point(10, canvas.rows - 12), kFont, 0.55,
              cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
}

bool OutputManager::tick(const DisplaySnapshot& snap, bool detection_on) {
  logPerformanceSummary();
  if (!window_open_) return true;

  cv::imshow(display_.window_name, render(snap, detection_on));
  const int key = cv::waitKey(1);
  if (key == 27 || key == 'q') return false;
  // Closed from the window manager
  return cv::getWindowProperty(display_.window_name, cv::WND_PROP_VISIBLE) >= 1.0;
}

void OutputManager::logPerformanceSummary(bool force) {
  auto now = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - last_summary_);

  if (!force && duration.count() < logging_.summary_interval_s) {
    return;
  }
  last_summary_ = now;

  StatSnapshot s = metrics_.snapshot();
  spdlog::info("Stream FPS: {:.1f}, Detection Runs/s: {:.1f}, inference p50={:.1f}ms p95={:.1f}ms",
               s.stream_fps, s.detection_rate, s.infer_p50, s.infer_p95);
  if (s.decode_failures > 0 || s.buffer_trims > 0) {
    spdlog::info("Frames {} | discarded parts {} | decode failures {} | buffer trims {}",
                 s.frames_received, s.payloads_discarded, s.decode_failures, s.buffer_trims);
  }
}
