#include "frame_demuxer.hpp"

#include <spdlog/spdlog.h>

FrameDemultiplexer::FrameDemultiplexer(DemuxConfig cfg)
    : cfg_(std::move(cfg)), buffer_(cfg_.boundary, cfg_.max_buffer_bytes) {}

std::vector<ImagePayload> FrameDemultiplexer::feed(const uint8_t* data, size_t len) {
  std::vector<ImagePayload> out;
  buffer_.append(data, len);

  const size_t marker_len = cfg_.boundary.size();
  while (!buffer_.empty()) {
    const size_t start = buffer_.index_of(cfg_.boundary, 0);
    if (start == ByteRingBuffer::npos) break;

    const size_t payload_begin = start + marker_len;
    const size_t next = buffer_.index_of(cfg_.boundary, payload_begin);
    if (next == ByteRingBuffer::npos) break;  // current part still incomplete

    const size_t payload_len = next - payload_begin;
    if (payload_len > cfg_.min_payload_bytes) {
      out.push_back(buffer_.copy_range(payload_begin, next));
      ++emitted_;
    } else {
      ++discarded_;
      spdlog::debug("Discarding {}-byte stream part (below {} bytes)", payload_len,
                    cfg_.min_payload_bytes);
    }
    buffer_.remove_prefix(next);
  }
  return out;
}

void FrameDemultiplexer::reset() {
  buffer_.clear();
  emitted_ = 0;
  discarded_ = 0;
}
