#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "types.hpp"

// Growable byte accumulator for partially received stream data. Memory is
// bounded: an append that pushes the length past the cap trims the buffer to
// the last occurrence of the trim marker, or clears it when there is none.
class ByteRingBuffer {
public:
  static constexpr size_t npos = static_cast<size_t>(-1);

  explicit ByteRingBuffer(std::vector<uint8_t> trim_marker,
                          size_t max_bytes = kMaxStreamBufferBytes);

  void append(const uint8_t* data, size_t len);
  void append(const std::vector<uint8_t>& chunk) { append(chunk.data(), chunk.size()); }

  // First offset >= from where pattern matches, or npos.
  size_t index_of(const std::vector<uint8_t>& pattern, size_t from = 0) const;
  size_t last_index_of(const std::vector<uint8_t>& pattern) const;

  // Drops bytes [0, n).
  void remove_prefix(size_t n);
  std::vector<uint8_t> copy_range(size_t begin, size_t end) const;
  void clear();

  size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }
  size_t capacity_limit() const { return max_bytes_; }
  uint64_t trim_count() const { return trims_; }

private:
  void enforce_cap();

  std::deque<uint8_t> bytes_;
  std::vector<uint8_t> trim_marker_;
  size_t max_bytes_;
  uint64_t trims_{0};
};

inline std::vector<uint8_t> to_bytes(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}
