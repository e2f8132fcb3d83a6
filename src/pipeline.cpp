#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

Pipeline::Pipeline(PipelineConfig cfg, std::unique_ptr<StreamTransport> transport,
                   ObjectDetector* detector, MetricsRegistry& m, FrameStore& store)
    : cfg_(std::move(cfg)),
      transport_(std::move(transport)),
      detector_(detector),
      metrics_(m),
      store_(store),
      demux_(cfg_.demux),
      scheduler_(cfg_.scheduler) {
  if (!transport_) throw std::invalid_argument("Pipeline requires a stream transport");
  detection_enabled_ = cfg_.scheduler.enabled && detector_ != nullptr;
  if (detector_) {
    worker_ = std::make_unique<InferenceWorker>(
        *detector_, outcomes_, [this](const InferenceOutcome& o) { publish_outcome(o); });
  }
}

Pipeline::~Pipeline() { stop(); }

bool Pipeline::start() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (running_.exchange(true)) return false;
  if (loop_thread_.joinable()) loop_thread_.join();  // previous session ended by itself

  stop_requested_ = false;
  demux_.reset();
  scheduler_.reset();
  outcomes_.reopen();
  discarded_seen_ = 0;
  store_.clear();
  store_.set_status(StreamState::Connecting, transport_->describe());
  transport_->reset();
  if (worker_) worker_->start();

  loop_thread_ = std::thread([this] { run_loop(); });
  return true;
}

void Pipeline::stop() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  stop_requested_ = true;
  transport_->cancel();
  if (loop_thread_.joinable()) loop_thread_.join();
}

void Pipeline::set_detection_enabled(bool enabled) {
  if (enabled && !detector_) {
    spdlog::warn("Detection requested but no usable model is loaded");
    return;
  }
  detection_enabled_ = enabled;
  if (!enabled) store_.clear_detections();
  spdlog::info("Object detection {}", enabled ? "ON" : "OFF");
}

void Pipeline::run_loop() {
  spdlog::info("Opening video stream {}", transport_->describe());
  std::string reason;
  try {
    TransportResult r =
        transport_->run([this](const uint8_t* d, size_t n) { return on_chunk(d, n); });
    switch (r.end) {
      case TransportEnd::Ended:
        reason = "Video stream ended.";
        spdlog::info("Video stream ended by server");
        break;
      case TransportEnd::Failed:
        reason = "Video stream error: " + r.message;
        spdlog::error("Video stream error: {}", r.message);
        break;
      case TransportEnd::Cancelled:
        reason = "Disconnected.";
        spdlog::info("Video stream cancelled");
        break;
    }
  } catch (const std::exception& e) {
    reason = std::string("Video stream error: ") + e.what();
    spdlog::error("Video stream aborted: {}", e.what());
  }
  teardown(reason);
}

bool Pipeline::on_chunk(const uint8_t* data, size_t len) {
  if (stop_requested_) return false;
  if (store_.status().state != StreamState::Active) {
    store_.set_status(StreamState::Active, "Video stream active.");
  }

  drain_outcomes();

  std::vector<ImagePayload> payloads = demux_.feed(data, len);
  if (demux_.discarded() > discarded_seen_) {
    metrics_.inc_discarded(demux_.discarded() - discarded_seen_);
    discarded_seen_ = demux_.discarded();
  }
  metrics_.set_buffer_trims(demux_.buffer_trims());

  scheduler_.set_enabled(detector_ != nullptr && detection_enabled_.load());
  for (auto& p : payloads) {
    auto frame = std::make_shared<const ImagePayload>(std::move(p));
    const uint64_t id = ++next_frame_id_;
    store_.publish_frame(frame, id);
    metrics_.inc_frame();

    if (scheduler_.try_admit(Clock::now())) {
      if (!worker_->submit(frame, id)) {
        // Worker refused (stopping); release the slot so the gate cannot stick.
        scheduler_.complete(Clock::now());
      }
    }
  }
  return !stop_requested_;
}

void Pipeline::drain_outcomes() {
  InferenceOutcome o;
  while (outcomes_.try_pop(o)) {
    scheduler_.complete(o.finished_at);
  }
}

// Worker thread.
void Pipeline::publish_outcome(const InferenceOutcome& o) {
  metrics_.inc_inference();
  if (o.status != DetectStatus::Ok) {
    metrics_.inc_decode_failure();
    spdlog::debug("Skipping frame {} ({})", o.frame_id, to_string(o.status));
    return;
  }

  metrics_.add_decode(o.timings.decode_ms);
  metrics_.add_infer(o.timings.infer_ms);
  if (detection_enabled_ && !stop_requested_) {
    store_.publish_detections(o.detections);
    // Detection may have been switched off while publishing.
    if (!detection_enabled_) store_.clear_detections();
  }
}

void Pipeline::teardown(const std::string& reason) {
  scheduler_.shutdown();
  if (worker_) worker_->stop();
  drain_outcomes();
  outcomes_.close();
  if (scheduler_.state(Clock::now()) == SchedulerState::Busy) {
    // The submitted job was dropped before it ran.
    scheduler_.complete(Clock::now());
  }

  demux_.reset();
  store_.clear();
  store_.set_status(StreamState::Inactive, reason);
  running_ = false;
  spdlog::info("Stream session closed ({} frames, {} inferences)", metrics_.frames_total(),
               metrics_.inferences_total());
}
