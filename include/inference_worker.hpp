#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "channel.hpp"
#include "detector.hpp"
#include "types.hpp"

struct InferenceOutcome {
  uint64_t frame_id{0};
  DetectStatus status{DetectStatus::Ok};
  DetectionSet detections;
  DetectTimings timings;
  TimePoint finished_at{};
};

// Runs detection off the stream-consumer thread. Holds at most one job; the
// scheduler upstream guarantees a new job is only submitted after the outcome
// of the previous one has been received.
//
// on_result, when set, sees each outcome on the worker thread as soon as it is
// ready, before it is posted to the channel.
class InferenceWorker {
public:
  using ResultHook = std::function<void(const InferenceOutcome&)>;

  InferenceWorker(ObjectDetector& detector, Channel<InferenceOutcome>& outcomes,
                  ResultHook on_result = {});
  ~InferenceWorker();

  void start();
  // Lets a running job finish, then joins. Jobs not yet started are dropped.
  void stop();

  // False when a job is already pending or running, or the worker is stopped.
  bool submit(std::shared_ptr<const ImagePayload> payload, uint64_t frame_id);

  bool busy() const { return busy_.load(); }

private:
  void loop();

  ObjectDetector& detector_;
  Channel<InferenceOutcome>& outcomes_;
  ResultHook on_result_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::shared_ptr<const ImagePayload> job_;
  uint64_t job_frame_id_{0};
  bool stopping_{false};
  std::atomic<bool> busy_{false};
  std::thread thread_;
};
