#pragma once
#include <string>
#include <vector>

// Maps integer class ids to display labels. Ids outside the table resolve to
// a synthetic "ClassID N" label instead of being rejected.
class LabelMap {
public:
  LabelMap();  // COCO, ids 0..79
  explicit LabelMap(std::vector<std::string> names) : names_(std::move(names)) {}

  // One label per line, line index is the class id. Throws std::runtime_error
  // when the file cannot be read or holds no labels.
  static LabelMap fromFile(const std::string& path);

  std::string label(int class_id) const;
  bool contains(int class_id) const;
  size_t size() const { return names_.size(); }

  static std::string syntheticLabel(int class_id);

private:
  std::vector<std::string> names_;
};
