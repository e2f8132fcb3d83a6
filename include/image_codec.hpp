#pragma once
#include "types.hpp"

// Still-image decode and resize, kept behind an interface so the detection
// path can be exercised without an image library.
class ImageCodec {
public:
  virtual ~ImageCodec() = default;

  // Decodes an encoded payload to RGB. Returns false on a corrupt payload.
  virtual bool decode(const ImagePayload& payload, RgbImage& out) = 0;
  // Bilinear resize to exactly width x height.
  virtual bool resize(const RgbImage& in, int width, int height, RgbImage& out) = 0;
};
