#pragma once
#include <map>
#include <string>
#include <vector>

#include "model_schema.hpp"

// Input geometry fixed at model-load time: one HxWx3 uint8 RGB tensor.
struct InputSpec {
  int width{0};
  int height{0};
  int channels{3};

  size_t byte_size() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
  }
};

// Output slot index -> float buffer, sized by the caller before invoke().
using OutputBuffers = std::map<int, std::vector<float>>;

// Runs the detection network. One call processes one image; outputs are
// written in place into the pre-sized buffers.
class InferenceInvoker {
public:
  virtual ~InferenceInvoker() = default;

  virtual InputSpec input() const = 0;
  virtual std::vector<TensorDescriptor> outputs() const = 0;
  virtual bool invoke(const std::vector<uint8_t>& rgb, OutputBuffers& outputs) = 0;
  virtual std::string name() const = 0;
};

// Element count of a tensor shape; non-positive dimensions count as 1.
size_t element_count(const std::vector<int64_t>& shape);
