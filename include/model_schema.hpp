#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Name and shape of one model output tensor, as reported by the engine.
struct TensorDescriptor {
  std::string name;
  std::vector<int64_t> shape;
};

// Which output slot carries which part of an SSD-style detection result.
struct OutputSchema {
  int boxes{-1};
  int classes{-1};
  int scores{-1};
  int count{-1};
  int max_detections{0};

  bool valid() const;
};

enum class SchemaMatch { None, ByName, ByShape };

struct SchemaResolution {
  bool ok{false};
  OutputSchema schema;
  SchemaMatch match{SchemaMatch::None};
  std::string error;
};

// Resolves the output layout once per loaded model. Tensor names are tried
// first (common TFLite / TF object-detection export suffixes); when they do not
// identify all four roles, tensors are classified by shape alone and the two
// [1,N] tensors are taken as scores then classes in encounter order.
SchemaResolution resolve_schema(const std::vector<TensorDescriptor>& outputs);

std::string describe(const OutputSchema& schema);
std::string shape_to_string(const std::vector<int64_t>& shape);
