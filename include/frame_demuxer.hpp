#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "byte_ring_buffer.hpp"
#include "types.hpp"

struct DemuxConfig {
  std::vector<uint8_t> boundary = to_bytes(kFrameBoundary);
  size_t max_buffer_bytes{kMaxStreamBufferBytes};
  size_t min_payload_bytes{kMinPayloadBytes};
};

// Reassembles multipart/x-mixed-replace chunks into whole image payloads.
// A payload is emitted only once the boundary that follows it has arrived.
class FrameDemultiplexer {
public:
  explicit FrameDemultiplexer(DemuxConfig cfg = DemuxConfig{});

  // Consumes one chunk; returns the payloads it completed, in stream order.
  std::vector<ImagePayload> feed(const uint8_t* data, size_t len);
  std::vector<ImagePayload> feed(const std::vector<uint8_t>& chunk) {
    return feed(chunk.data(), chunk.size());
  }

  void reset();

  size_t buffered_bytes() const { return buffer_.size(); }
  uint64_t emitted() const { return emitted_; }
  uint64_t discarded() const { return discarded_; }
  uint64_t buffer_trims() const { return buffer_.trim_count(); }

private:
  DemuxConfig cfg_;
  ByteRingBuffer buffer_;
  uint64_t emitted_{0};
  uint64_t discarded_{0};
};
