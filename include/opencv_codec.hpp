#pragma once

#include <opencv2/opencv.hpp>

#include "image_codec.hpp"

// JPEG decode and bilinear resize through OpenCV.
class OpenCvCodec : public ImageCodec {
public:
  bool decode(const ImagePayload& payload, RgbImage& out) override;
  bool resize(const RgbImage& in, int width, int height, RgbImage& out) override;
};

// Decodes a payload to a BGR Mat for drawing; empty Mat on failure.
cv::Mat decode_bgr(const ImagePayload& payload);
