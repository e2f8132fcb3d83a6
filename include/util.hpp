#pragma once
#include <string>

#include "detector.hpp"
#include "pipeline.hpp"
#include "types.hpp"

struct ServerConfig {
  std::string host{"192.168.1.100"};
  int port{5000};
  std::string video_path{"/video_feed"};
  std::string status_path{"/api/status"};
  std::string control_path{"/api/control"};
  int connect_timeout_s{10};
  int status_poll_interval_s{5};
};

struct DisplayConfig {
  bool enable_window{true};
  std::string window_name{"RoverEye-RT"};
  int canvas_width{960};
  int canvas_height{720};
  int refresh_ms{40};
};

struct LoggingConfig {
  std::string level{"info"};
  int summary_interval_s{5};
};

struct AppConfig {
  ServerConfig server;
  PipelineConfig pipeline;
  DetectorConfig detector;
  DisplayConfig display;
  LoggingConfig logging;
  int telemetry_port{9090};
};

AppConfig load_config(const std::string& path);

// Applies a logging level name (debug/info/warn/error) to the default logger.
void apply_log_level(const std::string& level);
