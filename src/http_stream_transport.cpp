#include "http_stream_transport.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

HttpStreamTransport::HttpStreamTransport(HttpStreamTarget target) : target_(std::move(target)) {}

HttpStreamTransport::~HttpStreamTransport() { cancel(); }

std::string HttpStreamTransport::describe() const {
  return "http://" + target_.host + ":" + std::to_string(target_.port) + target_.path;
}

void HttpStreamTransport::cancel() {
  cancelled_ = true;
  std::lock_guard<std::mutex> g(client_mu_);
  if (client_) client_->stop();
}

TransportResult HttpStreamTransport::run(const ChunkSink& sink) {
  if (cancelled_) return {TransportEnd::Cancelled, {}};

  auto client = std::make_shared<httplib::Client>(target_.host, target_.port);
  client->set_connection_timeout(target_.connect_timeout_s, 0);
  client->set_read_timeout(target_.read_timeout_s, 0);
  {
    std::lock_guard<std::mutex> g(client_mu_);
    client_ = client;
  }
  if (cancelled_) return {TransportEnd::Cancelled, {}};

  httplib::Headers headers = {
      {"Cache-Control", "no-cache"},
      {"Connection", "keep-alive"},
      {"Accept", "multipart/x-mixed-replace"},
  };

  int status = 0;
  auto res = client->Get(
      target_.path, headers,
      [&status](const httplib::Response& response) {
        status = response.status;
        if (response.status != 200) {
          spdlog::error("Video stream error: HTTP {} {}", response.status, response.reason);
          return false;
        }
        spdlog::info("Video stream HTTP connection successful");
        return true;
      },
      [this, &sink](const char* data, size_t len) {
        if (cancelled_) return false;
        // httplib hands body bytes as char; the demuxer works on uint8_t
        return sink(reinterpret_cast<const uint8_t*>(data), len);
      });

  {
    std::lock_guard<std::mutex> g(client_mu_);
    client_.reset();
  }

  if (cancelled_) return {TransportEnd::Cancelled, {}};
  if (status != 0 && status != 200) {
    return {TransportEnd::Failed, "HTTP status " + std::to_string(status)};
  }
  if (!res) {
    const auto err = res.error();
    // The sink stopped the read because the session is shutting down.
    if (err == httplib::Error::Canceled) return {TransportEnd::Cancelled, {}};
    return {TransportEnd::Failed, httplib::to_string(err)};
  }
  return {TransportEnd::Ended, {}};
}
