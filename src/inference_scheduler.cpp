#include "inference_scheduler.hpp"

const char* to_string(SchedulerState s) {
  switch (s) {
    case SchedulerState::Idle: return "idle";
    case SchedulerState::Busy: return "busy";
    case SchedulerState::Cooling: return "cooling";
  }
  return "unknown";
}

SchedulerState InferenceScheduler::state(TimePoint now) const {
  if (state_ == SchedulerState::Cooling && now >= cooling_until_) return SchedulerState::Idle;
  return state_;
}

bool InferenceScheduler::try_admit(TimePoint now) {
  if (shut_down_ || !cfg_.enabled || state(now) != SchedulerState::Idle) {
    ++refused_;
    return false;
  }
  state_ = SchedulerState::Busy;
  ++admitted_;
  return true;
}

void InferenceScheduler::complete(TimePoint now) {
  if (state_ != SchedulerState::Busy) return;
  if (shut_down_) {
    state_ = SchedulerState::Idle;
    return;
  }
  state_ = SchedulerState::Cooling;
  cooling_until_ = now + cfg_.cooldown;
}

void InferenceScheduler::shutdown() {
  shut_down_ = true;
  if (state_ == SchedulerState::Cooling) state_ = SchedulerState::Idle;
}

void InferenceScheduler::reset() {
  shut_down_ = false;
  state_ = SchedulerState::Idle;
  cooling_until_ = TimePoint{};
}
