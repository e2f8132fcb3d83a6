#include "class_names.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

LabelMap::LabelMap() {
  // COCO class names used by the stock SSD MobileNet detection models
  names_ = {"person",        "bicycle",      "car",
            "motorcycle",    "airplane",     "bus",
            "train",         "truck",        "boat",
            "traffic light", "fire hydrant", "stop sign",
            "parking meter", "bench",        "bird",
            "cat",           "dog",          "horse",
            "sheep",         "cow",          "elephant",
            "bear",          "zebra",        "giraffe",
            "backpack",      "umbrella",     "handbag",
            "tie",           "suitcase",     "frisbee",
            "skis",          "snowboard",    "sports ball",
            "kite",          "baseball bat", "baseball glove",
            "skateboard",    "surfboard",    "tennis racket",
            "bottle",        "wine glass",   "cup",
            "fork",          "knife",        "spoon",
            "bowl",          "banana",       "apple",
            "sandwich",      "orange",       "broccoli",
            "carrot",        "hot dog",      "pizza",
            "donut",         "cake",         "chair",
            "couch",         "potted plant", "bed",
            "dining table",  "toilet",       "tv",
            "laptop",        "mouse",        "remote",
            "keyboard",      "cell phone",   "microwave",
            "oven",          "toaster",      "sink",
            "refrigerator",  "book",         "clock",
            "vase",          "scissors",     "teddy bear",
            "hair drier",    "toothbrush"};
}

LabelMap LabelMap::fromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.good()) {
    throw std::runtime_error("Cannot open labels file: " + path);
  }

  std::vector<std::string> names;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    names.push_back(line);
  }
  if (names.empty()) {
    throw std::runtime_error("Labels file is empty: " + path);
  }

  spdlog::info("Loaded {} class labels from {}", names.size(), path);
  return LabelMap(std::move(names));
}

bool LabelMap::contains(int class_id) const {
  return class_id >= 0 && class_id < static_cast<int>(names_.size()) &&
         !names_[static_cast<size_t>(class_id)].empty();
}

std::string LabelMap::label(int class_id) const {
  if (contains(class_id)) return names_[static_cast<size_t>(class_id)];
  return syntheticLabel(class_id);
}

std::string LabelMap::syntheticLabel(int class_id) {
  return "ClassID " + std::to_string(class_id);
}
