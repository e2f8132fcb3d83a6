#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "stream_transport.hpp"

namespace httplib {
class Client;
}

struct HttpStreamTarget {
  std::string host;
  int port{5000};
  std::string path{"/video_feed"};
  int connect_timeout_s{10};
  int read_timeout_s{10};
};

// GET of the server's multipart video endpoint, delivered chunk by chunk.
class HttpStreamTransport : public StreamTransport {
public:
  explicit HttpStreamTransport(HttpStreamTarget target);
  ~HttpStreamTransport() override;

  TransportResult run(const ChunkSink& sink) override;
  void cancel() override;
  void reset() override { cancelled_ = false; }
  std::string describe() const override;

private:
  HttpStreamTarget target_;
  std::atomic<bool> cancelled_{false};
  std::mutex client_mu_;
  std::shared_ptr<httplib::Client> client_;
};
