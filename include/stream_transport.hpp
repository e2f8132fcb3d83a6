#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

enum class TransportEnd { Ended, Failed, Cancelled };

struct TransportResult {
  TransportEnd end{TransportEnd::Ended};
  std::string message;
};

// Delivers the raw bytes of one long-lived video response. run() blocks until
// the server closes the stream, an error occurs, or the sink returns false.
class StreamTransport {
public:
  // Return false to stop reading.
  using ChunkSink = std::function<bool(const uint8_t* data, size_t len)>;

  virtual ~StreamTransport() = default;

  virtual TransportResult run(const ChunkSink& sink) = 0;
  // May be called from another thread to abort a blocked run(). A cancel that
  // arrives before run() starts makes that run() return Cancelled at once.
  virtual void cancel() = 0;
  // Clears a previous cancel() so the transport can be run again.
  virtual void reset() = 0;
  virtual std::string describe() const = 0;
};
