#include "frame_store.hpp"

const char* to_string(StreamState s) {
  switch (s) {
    case StreamState::Idle: return "idle";
    case StreamState::Connecting: return "connecting";
    case StreamState::Active: return "active";
    case StreamState::Inactive: return "inactive";
  }
  return "unknown";
}

void FrameStore::publish_frame(std::shared_ptr<const ImagePayload> frame, uint64_t frame_id) {
  std::lock_guard<std::mutex> g(mu_);
  frame_ = std::move(frame);
  frame_id_ = frame_id;
}

void FrameStore::publish_detections(DetectionSet set) {
  std::lock_guard<std::mutex> g(mu_);
  detections_ = std::move(set);
}

void FrameStore::clear_detections() {
  std::lock_guard<std::mutex> g(mu_);
  detections_ = DetectionSet{};
}

void FrameStore::set_status(StreamState state, std::string message) {
  std::lock_guard<std::mutex> g(mu_);
  status_.state = state;
  status_.message = std::move(message);
}

void FrameStore::clear() {
  std::lock_guard<std::mutex> g(mu_);
  frame_.reset();
  frame_id_ = 0;
  detections_ = DetectionSet{};
}

DisplaySnapshot FrameStore::snapshot() const {
  std::lock_guard<std::mutex> g(mu_);
  DisplaySnapshot s;
  s.frame = frame_;
  s.frame_id = frame_id_;
  s.detections = detections_;
  s.status = status_;
  return s;
}

StreamStatus FrameStore::status() const {
  std::lock_guard<std::mutex> g(mu_);
  return status_;
}

bool FrameStore::has_frame() const {
  std::lock_guard<std::mutex> g(mu_);
  return frame_ != nullptr;
}
