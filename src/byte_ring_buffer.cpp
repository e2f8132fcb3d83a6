#include "byte_ring_buffer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

ByteRingBuffer::ByteRingBuffer(std::vector<uint8_t> trim_marker, size_t max_bytes)
    : trim_marker_(std::move(trim_marker)), max_bytes_(max_bytes) {}

void ByteRingBuffer::append(const uint8_t* data, size_t len) {
  if (data == nullptr || len == 0) return;
  bytes_.insert(bytes_.end(), data, data + len);
  if (bytes_.size() > max_bytes_) enforce_cap();
}

size_t ByteRingBuffer::index_of(const std::vector<uint8_t>& pattern, size_t from) const {
  if (pattern.empty() || bytes_.size() < pattern.size()) return npos;
  if (from > bytes_.size() - pattern.size()) return npos;
  auto it = std::search(bytes_.begin() + static_cast<std::ptrdiff_t>(from), bytes_.end(),
                        pattern.begin(), pattern.end());
  if (it == bytes_.end()) return npos;
  return static_cast<size_t>(it - bytes_.begin());
}

size_t ByteRingBuffer::last_index_of(const std::vector<uint8_t>& pattern) const {
  if (pattern.empty() || bytes_.size() < pattern.size()) return npos;
  auto it = std::find_end(bytes_.begin(), bytes_.end(), pattern.begin(), pattern.end());
  if (it == bytes_.end()) return npos;
  return static_cast<size_t>(it - bytes_.begin());
}

void ByteRingBuffer::remove_prefix(size_t n) {
  n = std::min(n, bytes_.size());
  bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<uint8_t> ByteRingBuffer::copy_range(size_t begin, size_t end) const {
  end = std::min(end, bytes_.size());
  if (begin >= end) return {};
  return std::vector<uint8_t>(bytes_.begin() + static_cast<std::ptrdiff_t>(begin),
                              bytes_.begin() + static_cast<std::ptrdiff_t>(end));
}

void ByteRingBuffer::clear() { bytes_.clear(); }

void ByteRingBuffer::enforce_cap() {
  ++trims_;
  const size_t before = bytes_.size();
  const size_t last = last_index_of(trim_marker_);
  // A marker already at offset 0 would free nothing, so it is treated as absent.
  // The tail from the last marker must itself fit under the cap.
  if (last != npos && last > 0 && before - last <= max_bytes_) {
    remove_prefix(last);
    spdlog::warn("Stream buffer exceeded {} bytes ({}), trimmed to last boundary ({} bytes kept)",
                 max_bytes_, before, bytes_.size());
  } else {
    bytes_.clear();
    spdlog::warn("Stream buffer exceeded {} bytes ({}) without a usable boundary, cleared",
                 max_bytes_, before);
  }
}
