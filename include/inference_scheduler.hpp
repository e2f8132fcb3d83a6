#pragma once
#include <chrono>
#include <cstdint>

#include "types.hpp"

enum class SchedulerState { Idle, Busy, Cooling };

const char* to_string(SchedulerState s);

struct SchedulerConfig {
  std::chrono::milliseconds cooldown{150};
  bool enabled{true};
};

// Admission gate for the detector. At most one inference is in flight, and
// after each one the gate stays closed for the cooldown interval. Frames that
// are refused still go to the display; only detection is skipped.
//
// Not thread-safe: owned and driven by the stream consumer thread. Completion
// is reported back to it as a message rather than by the worker directly.
class InferenceScheduler {
public:
  explicit InferenceScheduler(SchedulerConfig cfg = SchedulerConfig{}) : cfg_(cfg) {}

  // Idle -> Busy. Returns false (and changes nothing) in any other state, when
  // detection is disabled, or after shutdown().
  bool try_admit(TimePoint now);

  // Busy -> Cooling until now + cooldown. Ignored unless Busy.
  void complete(TimePoint now);

  SchedulerState state(TimePoint now) const;

  void set_enabled(bool enabled) { cfg_.enabled = enabled; }
  bool enabled() const { return cfg_.enabled; }

  // Stops admissions and cancels a pending cooldown. An inference that is
  // still running may complete(); it then lands in Idle, never stuck in Busy.
  void shutdown();
  void reset();
  bool is_shut_down() const { return shut_down_; }

  uint64_t admitted() const { return admitted_; }
  uint64_t refused() const { return refused_; }

private:
  SchedulerConfig cfg_;
  SchedulerState state_{SchedulerState::Idle};
  TimePoint cooling_until_{};
  bool shut_down_{false};
  uint64_t admitted_{0};
  uint64_t refused_{0};
};
