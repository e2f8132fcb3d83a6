#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "channel.hpp"

struct RemoteEndpoint {
  std::string host;
  int port{5000};
  std::string status_path{"/api/status"};
  std::string control_path{"/api/control"};
  int poll_interval_s{5};
};

bool is_drive_direction(const std::string& direction);

// Client for the car server's control and status API. Drive commands are
// posted by a background sender, never waited on by the caller. Only the newest
// unsent command is kept; older ones are superseded rather than sent late.
// Status is polled periodically and the last good reply is kept.
class RemoteControl {
public:
  explicit RemoteControl(RemoteEndpoint endpoint);
  ~RemoteControl();

  // Blocking status fetch used as the connection check. Fills out on HTTP 200.
  bool probe(nlohmann::json& out, int timeout_s = 8);

  // False for an unknown direction or after stop().
  bool send_command(const std::string& direction);

  void start();
  void stop();

  // Commands accepted but not yet handed to the sender; at most one.
  size_t pending_commands() const { return commands_.size(); }
  size_t superseded_commands() const { return commands_.evicted(); }

  nlohmann::json last_status() const;
  bool status_ok() const { return status_ok_.load(); }

private:
  bool fetch_status(nlohmann::json& out, int timeout_s);
  void post_command(const std::string& direction);
  void sender_loop();
  void poller_loop();

  RemoteEndpoint endpoint_;
  Channel<std::string> commands_{1};

  mutable std::mutex status_mu_;
  nlohmann::json last_status_ = nlohmann::json::object();
  std::atomic<bool> status_ok_{false};

  std::mutex wake_mu_;
  std::condition_variable wake_cv_;
  std::atomic<bool> running_{false};
  std::thread sender_;
  std::thread poller_;
};
