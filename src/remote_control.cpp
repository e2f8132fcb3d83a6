#include "remote_control.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>

bool is_drive_direction(const std::string& direction) {
  static const std::array<const char*, 5> kDirections = {"forward", "backward", "left", "right",
                                                         "stop"};
  for (const char* d : kDirections) {
    if (direction == d) return true;
  }
  return false;
}

RemoteControl::RemoteControl(RemoteEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

RemoteControl::~RemoteControl() { stop(); }

bool RemoteControl::fetch_status(nlohmann::json& out, int timeout_s) {
  httplib::Client cli(endpoint_.host, endpoint_.port);
  cli.set_connection_timeout(timeout_s, 0);
  cli.set_read_timeout(timeout_s, 0);

  auto res = cli.Get(endpoint_.status_path);
  if (!res) {
    spdlog::debug("Status request failed: {}", httplib::to_string(res.error()));
    return false;
  }
  if (res->status != 200) {
    spdlog::debug("Status request returned HTTP {}", res->status);
    return false;
  }

  try {
    out = nlohmann::json::parse(res->body);
  } catch (const nlohmann::json::parse_error& e) {
    spdlog::warn("Status reply is not valid JSON: {}", e.what());
    return false;
  }
  return true;
}

bool RemoteControl::probe(nlohmann::json& out, int timeout_s) {
  if (!fetch_status(out, timeout_s)) return false;
  std::lock_guard<std::mutex> g(status_mu_);
  last_status_ = out;
  status_ok_ = true;
  return true;
}

bool RemoteControl::send_command(const std::string& direction) {
  if (!is_drive_direction(direction)) {
    spdlog::warn("Ignoring unknown drive command '{}'", direction);
    return false;
  }
  return commands_.push(direction);
}

void RemoteControl::post_command(const std::string& direction) {
  httplib::Client cli(endpoint_.host, endpoint_.port);
  cli.set_connection_timeout(2, 0);
  cli.set_read_timeout(2, 0);

  auto res = cli.Post(endpoint_.control_path + "/" + direction);
  if (!res) {
    spdlog::warn("Control command {} failed: {}", direction, httplib::to_string(res.error()));
    return;
  }
  if (res->status != 200) {
    spdlog::warn("Control command {} failed: HTTP {}", direction, res->status);
    return;
  }

  std::string message;
  try {
    auto body = nlohmann::json::parse(res->body);
    message = body.value("message", std::string{});
  } catch (const nlohmann::json::parse_error&) {
    message = res->body;
  }
  spdlog::debug("Control: {}. Server: {}", direction, message);
}

void RemoteControl::start() {
  if (running_.exchange(true)) return;
  commands_.reopen();
  sender_ = std::thread([this] { sender_loop(); });
  poller_ = std::thread([this] { poller_loop(); });
}

void RemoteControl::stop() {
  {
    // Under wake_mu_ so the poller cannot miss the wakeup between its check and wait
    std::lock_guard<std::mutex> lk(wake_mu_);
    if (!running_.exchange(false)) return;
  }
  commands_.close();
  wake_cv_.notify_all();
  if (sender_.joinable()) sender_.join();
  if (poller_.joinable()) poller_.join();
  status_ok_ = false;
}

void RemoteControl::sender_loop() {
  std::string direction;
  while (running_) {
    if (commands_.pop_for(direction, std::chrono::milliseconds(200))) post_command(direction);
  }
}

void RemoteControl::poller_loop() {
  const auto interval = std::chrono::seconds(std::max(1, endpoint_.poll_interval_s));
  while (running_) {
    nlohmann::json status;
    if (fetch_status(status, 3)) {
      std::lock_guard<std::mutex> g(status_mu_);
      last_status_ = std::move(status);
      status_ok_ = true;
    } else {
      status_ok_ = false;
    }

    std::unique_lock<std::mutex> lk(wake_mu_);
    wake_cv_.wait_for(lk, interval, [this] { return !running_.load(); });
  }
}

nlohmann::json RemoteControl::last_status() const {
  std::lock_guard<std::mutex> g(status_mu_);
  return last_status_;
}
