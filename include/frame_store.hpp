#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "types.hpp"

enum class StreamState { Idle, Connecting, Active, Inactive };

const char* to_string(StreamState s);

struct StreamStatus {
  StreamState state{StreamState::Idle};
  std::string message;
};

struct DisplaySnapshot {
  std::shared_ptr<const ImagePayload> frame;
  uint64_t frame_id{0};
  DetectionSet detections;
  StreamStatus status;
};

// Latest-value hand-off from the stream consumer to the render path. Each
// publish replaces the previous value wholesale; readers always see the most
// recent frame and the most recent complete DetectionSet.
class FrameStore {
public:
  void publish_frame(std::shared_ptr<const ImagePayload> frame, uint64_t frame_id);
  void publish_detections(DetectionSet set);
  void clear_detections();
  void set_status(StreamState state, std::string message = {});

  // Drops frame and detections; status is left as is.
  void clear();

  DisplaySnapshot snapshot() const;
  StreamStatus status() const;
  bool has_frame() const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<const ImagePayload> frame_;
  uint64_t frame_id_{0};
  DetectionSet detections_;
  StreamStatus status_;
};
