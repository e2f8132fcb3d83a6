#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// Multi-producer queue used to hand values between threads. With a nonzero
// capacity a push onto a full channel evicts the oldest value, so readers only
// ever see the newest ones.
template <typename T>
class Channel {
public:
  explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

  // Returns false once the channel is closed; the value is dropped.
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lk(m_);
      if (closed_) return false;
      while (capacity_ > 0 && q_.size() >= capacity_) {
        q_.pop_front();
        ++evicted_;
      }
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lk(m_);
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
  }

  template <class Rep, class Period>
  bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [this] { return closed_ || !q_.empty(); });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void reopen() {
    std::lock_guard<std::mutex> lk(m_);
    closed_ = false;
    q_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(m_);
    return q_.size();
  }

  size_t evicted() const {
    std::lock_guard<std::mutex> lk(m_);
    return evicted_;
  }

private:
  const size_t capacity_;
  size_t evicted_{0};
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_{false};
};
