#include "model_schema.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <set>
#include <sstream>

namespace {

enum Role { kBoxes = 0, kClasses, kScores, kCount, kRoleCount };

const char* role_name(int role) {
  switch (role) {
    case kBoxes: return "boxes";
    case kClasses: return "classes";
    case kScores: return "scores";
    case kCount: return "count";
  }
  return "?";
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_boxes_shape(const std::vector<int64_t>& s) {
  return s.size() == 3 && s[0] == 1 && s[2] == 4;
}

bool is_vector_shape(const std::vector<int64_t>& s) { return s.size() == 2 && s[0] == 1; }

bool is_count_shape(const std::vector<int64_t>& s) {
  return (s.size() == 1 && s[0] == 1) || (s.size() == 2 && s[0] == 1 && s[1] == 1);
}

bool shape_fits(int role, const std::vector<int64_t>& s) {
  switch (role) {
    case kBoxes: return is_boxes_shape(s);
    case kClasses:
    case kScores: return is_vector_shape(s);
    case kCount: return is_count_shape(s);
  }
  return false;
}

// Suffix tiers, most specific first. A tensor is matched against every role
// in one tier before the next tier is tried, so "...PostProcess:2" is taken as
// scores and never as the classes role's bare ":2".
constexpr int kTierCount = 3;
const std::array<std::array<const char*, kRoleCount>, kTierCount> kRoleSuffixes = {{
    {{"TFLite_Detection_PostProcess", "TFLite_Detection_PostProcess:1",
      "TFLite_Detection_PostProcess:2", "TFLite_Detection_PostProcess:3"}},
    {{"detection_boxes", "detection_classes", "detection_scores", "num_detections"}},
    {{":3", ":2", ":1", ":0"}},
}};

bool all_distinct(const OutputSchema& s) {
  std::set<int> idx{s.boxes, s.classes, s.scores, s.count};
  return idx.size() == 4;
}

int middle_dim(const TensorDescriptor& t) {
  return t.shape.size() == 3 ? static_cast<int>(t.shape[1]) : 0;
}

bool resolve_by_name(const std::vector<TensorDescriptor>& outputs, OutputSchema& out) {
  std::array<int, kRoleCount> slot;
  slot.fill(-1);

  for (size_t i = 0; i < outputs.size(); ++i) {
    const auto& t = outputs[i];
    bool taken = false;
    for (int tier = 0; tier < kTierCount && !taken; ++tier) {
      for (int role = 0; role < kRoleCount; ++role) {
        if (slot[role] != -1) continue;
        if (ends_with(t.name, kRoleSuffixes[tier][role]) && shape_fits(role, t.shape)) {
          slot[role] = static_cast<int>(i);
          taken = true;
          spdlog::debug("Schema: output {} '{}' {} -> {} (by name)", i, t.name,
                        shape_to_string(t.shape), role_name(role));
          break;
        }
      }
    }
  }

  for (int role = 0; role < kRoleCount; ++role) {
    if (slot[role] == -1) {
      spdlog::debug("Schema: no output matched role '{}' by name", role_name(role));
      return false;
    }
  }

  out.boxes = slot[kBoxes];
  out.classes = slot[kClasses];
  out.scores = slot[kScores];
  out.count = slot[kCount];
  out.max_detections = middle_dim(outputs[out.boxes]);
  return out.valid();
}

bool resolve_by_shape(const std::vector<TensorDescriptor>& outputs, OutputSchema& out) {
  std::vector<int> vectors;
  for (size_t i = 0; i < outputs.size(); ++i) {
    const auto& s = outputs[i].shape;
    const int idx = static_cast<int>(i);
    if (is_boxes_shape(s)) {
      if (out.boxes == -1) out.boxes = idx;
    } else if (is_count_shape(s)) {
      if (out.count == -1) out.count = idx;
    } else if (is_vector_shape(s)) {
      vectors.push_back(idx);
    }
  }

  if (out.boxes == -1 || out.count == -1 || vectors.size() < 2) return false;

  out.scores = vectors[0];
  out.classes = vectors[1];
  out.max_detections = middle_dim(outputs[out.boxes]);
  return out.valid();
}

}  // namespace

bool OutputSchema::valid() const {
  return boxes >= 0 && classes >= 0 && scores >= 0 && count >= 0 && max_detections >= 1 &&
         all_distinct(*this);
}

SchemaResolution resolve_schema(const std::vector<TensorDescriptor>& outputs) {
  SchemaResolution res;

  if (outputs.size() < 4) {
    res.error = fmt::format("model has {} output tensors, need at least 4", outputs.size());
    return res;
  }

  OutputSchema by_name;
  if (resolve_by_name(outputs, by_name)) {
    res.ok = true;
    res.schema = by_name;
    res.match = SchemaMatch::ByName;
    return res;
  }

  spdlog::warn("Output tensors could not be mapped by name, falling back to shape-based mapping");
  OutputSchema by_shape;
  if (resolve_by_shape(outputs, by_shape)) {
    res.ok = true;
    res.schema = by_shape;
    res.match = SchemaMatch::ByShape;
    return res;
  }

  std::ostringstream os;
  os << "unable to map detection outputs (";
  for (size_t i = 0; i < outputs.size(); ++i) {
    if (i) os << ", ";
    os << i << ":'" << outputs[i].name << "'" << shape_to_string(outputs[i].shape);
  }
  os << ")";
  res.error = os.str();
  return res;
}

std::string describe(const OutputSchema& s) {
  return fmt::format("boxes={} classes={} scores={} count={} max_detections={}", s.boxes,
                     s.classes, s.scores, s.count, s.max_detections);
}

std::string shape_to_string(const std::vector<int64_t>& shape) {
  std::ostringstream os;
  os << "[";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i) os << ",";
    os << shape[i];
  }
  os << "]";
  return os.str();
}
