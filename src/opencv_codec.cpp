#include "opencv_codec.hpp"

#include <spdlog/spdlog.h>

namespace {

// Header over caller-owned bytes without copying. cv::Mat has no const-data
// constructor; callers only pass the result to read-only OpenCV calls.
cv::Mat borrow(const uint8_t* data, int rows, int cols, int type) {
  return cv::Mat(rows, cols, type, const_cast<uint8_t*>(data));
}

bool to_rgb_image(const cv::Mat& rgb, RgbImage& out) {
  if (rgb.empty() || rgb.type() != CV_8UC3) return false;
  cv::Mat packed = rgb.isContinuous() ? rgb : rgb.clone();
  out.width = packed.cols;
  out.height = packed.rows;
  out.pixels.assign(packed.data, packed.data + packed.total() * packed.elemSize());
  return true;
}

}  // namespace

cv::Mat decode_bgr(const ImagePayload& payload) {
  if (payload.empty()) return {};
  try {
    return cv::imdecode(borrow(payload.data(), 1, static_cast<int>(payload.size()), CV_8UC1),
                        cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    spdlog::debug("imdecode failed: {}", e.what());
    return {};
  }
}

bool OpenCvCodec::decode(const ImagePayload& payload, RgbImage& out) {
  cv::Mat bgr = decode_bgr(payload);
  if (bgr.empty()) return false;
  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  return to_rgb_image(rgb, out);
}

bool OpenCvCodec::resize(const RgbImage& in, int width, int height, RgbImage& out) {
  if (in.empty() || width <= 0 || height <= 0) return false;
  const cv::Mat src = borrow(in.pixels.data(), in.height, in.width, CV_8UC3);
  cv::Mat dst;
  cv::resize(src, dst, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);
  return to_rgb_image(dst, out);
}
