#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

// Events per second over a trailing time window. Reading does not reset it.
class RateWindow {
public:
  explicit RateWindow(std::chrono::milliseconds window = std::chrono::seconds(5),
                      TimePoint start = Clock::now())
      : window_(window), start_(start) {}

  void mark(TimePoint t = Clock::now()) {
    std::lock_guard<std::mutex> g(mu_);
    // Concurrent callers may arrive slightly out of order; keep the deque sorted
    if (!events_.empty() && t < events_.back()) t = events_.back();
    events_.push_back(t);
    prune(t);
  }

  double rate(TimePoint now = Clock::now()) const {
    std::lock_guard<std::mutex> g(mu_);
    const TimePoint cutoff = now - window_;
    const auto first = std::upper_bound(events_.begin(), events_.end(), cutoff);
    const auto n = std::distance(first, events_.end());
    // Until a full window has passed, divide by the time actually covered
    const auto span = std::min<Clock::duration>(window_, now - start_);
    const double secs = std::chrono::duration<double>(span).count();
    return secs > 0.0 ? static_cast<double>(n) / secs : 0.0;
  }

private:
  void prune(TimePoint now) {
    const TimePoint cutoff = now - window_;
    while (!events_.empty() && (events_.front() <= cutoff || events_.size() > kMaxEvents)) {
      events_.pop_front();
    }
  }

  static constexpr size_t kMaxEvents = 4096;

  Clock::duration window_;
  TimePoint start_;
  mutable std::mutex mu_;
  std::deque<TimePoint> events_;
};

struct StatSnapshot {
  double decode_p50{0}, decode_p95{0};
  double infer_p50{0}, infer_p95{0}, infer_p99{0};
  uint64_t frames_received{0};
  uint64_t payloads_discarded{0};
  uint64_t inference_runs{0};
  uint64_t decode_failures{0};
  uint64_t buffer_trims{0};
  double stream_fps{0};
  double detection_rate{0};  // completed inferences per second
};

class MetricsRegistry {
public:
  void add_decode(double ms) { decode_.add(ms); }
  void add_infer(double ms) { infer_.add(ms); }

  void inc_frame() {
    frames_.fetch_add(1, std::memory_order_relaxed);
    frame_rate_.mark();
  }
  void inc_discarded(uint64_t n = 1) { discarded_.fetch_add(n, std::memory_order_relaxed); }
  void inc_inference() {
    inferences_.fetch_add(1, std::memory_order_relaxed);
    inference_rate_.mark();
  }
  void inc_decode_failure() { decode_failures_.fetch_add(1, std::memory_order_relaxed); }
  void set_buffer_trims(uint64_t n) { buffer_trims_.store(n, std::memory_order_relaxed); }

  uint64_t frames_total() const { return frames_.load(std::memory_order_relaxed); }
  uint64_t inferences_total() const { return inferences_.load(std::memory_order_relaxed); }
  uint64_t decode_failures_total() const { return decode_failures_.load(std::memory_order_relaxed); }

  // Percentiles over the rolling sample window; rates over the last five seconds.
  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist decode_, infer_;
  std::atomic<uint64_t> frames_{0};
  std::atomic<uint64_t> discarded_{0};
  std::atomic<uint64_t> inferences_{0};
  std::atomic<uint64_t> decode_failures_{0};
  std::atomic<uint64_t> buffer_trims_{0};
  RateWindow frame_rate_, inference_rate_;
};
