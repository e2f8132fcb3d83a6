#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "channel.hpp"
#include "detector.hpp"
#include "frame_demuxer.hpp"
#include "frame_store.hpp"
#include "inference_scheduler.hpp"
#include "inference_worker.hpp"
#include "metrics.hpp"
#include "stream_transport.hpp"
#include "types.hpp"

struct PipelineConfig {
  DemuxConfig demux;
  SchedulerConfig scheduler;
};

// One stream session: a consumer thread reads the transport and splits it into
// frames, publishes every frame for display, and hands admitted frames to the
// inference worker. The worker publishes detections as soon as they are ready,
// so a stalled stream still shows the last result. Completions come back to
// the consumer over a channel; it is the only thread touching the demuxer and
// the scheduler.
class Pipeline {
public:
  // detector may be null: frames are still shown, detection never runs.
  Pipeline(PipelineConfig cfg, std::unique_ptr<StreamTransport> transport, ObjectDetector* detector,
           MetricsRegistry& m, FrameStore& store);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  bool start();  // Start the consumer loop in a background thread
  void stop();   // Cancel the read, tear down, and join
  bool running() const { return running_.load(); }

  void set_detection_enabled(bool enabled);
  bool detection_enabled() const { return detection_enabled_.load(); }
  bool detection_available() const { return detector_ != nullptr; }

  // Consumer-path entry point; returns false once the session is stopping.
  bool on_chunk(const uint8_t* data, size_t len);

private:
  void run_loop();
  void drain_outcomes();
  void publish_outcome(const InferenceOutcome& o);
  void teardown(const std::string& reason);

  PipelineConfig cfg_;
  std::unique_ptr<StreamTransport> transport_;
  ObjectDetector* detector_;
  MetricsRegistry& metrics_;
  FrameStore& store_;

  FrameDemultiplexer demux_;
  InferenceScheduler scheduler_;
  Channel<InferenceOutcome> outcomes_;
  std::unique_ptr<InferenceWorker> worker_;

  uint64_t next_frame_id_{0};
  uint64_t discarded_seen_{0};

  std::mutex lifecycle_mu_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> detection_enabled_{true};
  std::thread loop_thread_;
};
