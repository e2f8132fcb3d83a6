#include "inference_worker.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

InferenceWorker::InferenceWorker(ObjectDetector& detector, Channel<InferenceOutcome>& outcomes,
                                 ResultHook on_result)
    : detector_(detector), outcomes_(outcomes), on_result_(std::move(on_result)) {}

InferenceWorker::~InferenceWorker() { stop(); }

void InferenceWorker::start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = false;
    job_.reset();
  }
  thread_ = std::thread([this] { loop(); });
}

void InferenceWorker::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
    job_.reset();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  busy_ = false;
}

bool InferenceWorker::submit(std::shared_ptr<const ImagePayload> payload, uint64_t frame_id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_ || !thread_.joinable() || job_ || busy_.load()) return false;
    job_ = std::move(payload);
    job_frame_id_ = frame_id;
    busy_ = true;
  }
  cv_.notify_one();
  return true;
}

void InferenceWorker::loop() {
  for (;;) {
    std::shared_ptr<const ImagePayload> job;
    uint64_t frame_id = 0;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || job_ != nullptr; });
      if (stopping_) return;
      job = std::move(job_);
      job_.reset();
      frame_id = job_frame_id_;
    }

    InferenceOutcome outcome;
    outcome.frame_id = frame_id;
    outcome.detections.frame_id = frame_id;
    try {
      outcome.status = detector_.detect(*job, outcome.detections, &outcome.timings);
    } catch (const std::exception& e) {
      spdlog::error("Detection on frame {} threw: {}", frame_id, e.what());
      outcome.status = DetectStatus::InferenceFailed;
    }
    outcome.finished_at = Clock::now();

    if (on_result_) on_result_(outcome);
    busy_ = false;
    outcomes_.push(std::move(outcome));
  }
}
