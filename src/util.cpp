#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["server"]) {
    auto s = y["server"];
    if (s["host"]) c.server.host = s["host"].as<std::string>();
    if (s["port"]) c.server.port = s["port"].as<int>();
    if (s["video_path"]) c.server.video_path = s["video_path"].as<std::string>();
    if (s["status_path"]) c.server.status_path = s["status_path"].as<std::string>();
    if (s["control_path"]) c.server.control_path = s["control_path"].as<std::string>();
    if (s["connect_timeout_s"]) c.server.connect_timeout_s = s["connect_timeout_s"].as<int>();
    if (s["status_poll_interval_s"])
      c.server.status_poll_interval_s = s["status_poll_interval_s"].as<int>();
  }

  if (y["stream"]) {
    auto s = y["stream"];
    if (s["max_buffer_bytes"])
      c.pipeline.demux.max_buffer_bytes = s["max_buffer_bytes"].as<size_t>();
    if (s["min_payload_bytes"])
      c.pipeline.demux.min_payload_bytes = s["min_payload_bytes"].as<size_t>();
  }

  if (y["scheduler"] && y["scheduler"]["cooldown_ms"])
    c.pipeline.scheduler.cooldown =
        std::chrono::milliseconds(y["scheduler"]["cooldown_ms"].as<int>());

  if (y["detector"]) {
    auto d = y["detector"];
    if (d["engine_path"]) c.detector.engine_path = d["engine_path"].as<std::string>();
    if (d["labels_path"]) c.detector.labels_path = d["labels_path"].as<std::string>();
    if (d["confidence_threshold"])
      c.detector.confidence_threshold = d["confidence_threshold"].as<float>();
    if (d["nms_threshold"]) c.detector.nms_threshold = d["nms_threshold"].as<float>();
    if (d["enabled"]) c.detector.enabled = d["enabled"].as<bool>();
  }
  c.pipeline.scheduler.enabled = c.detector.enabled;

  if (y["display"]) {
    auto d = y["display"];
    if (d["enable_window"]) c.display.enable_window = d["enable_window"].as<bool>();
    if (d["window_name"]) c.display.window_name = d["window_name"].as<std::string>();
    if (d["canvas_width"]) c.display.canvas_width = d["canvas_width"].as<int>();
    if (d["canvas_height"]) c.display.canvas_height = d["canvas_height"].as<int>();
    if (d["refresh_ms"]) c.display.refresh_ms = d["refresh_ms"].as<int>();
  }

  if (y["logging"]) {
    auto l = y["logging"];
    if (l["level"]) c.logging.level = l["level"].as<std::string>();
    if (l["summary_interval_s"]) c.logging.summary_interval_s = l["summary_interval_s"].as<int>();
  }

  if (y["telemetry"] && y["telemetry"]["port"]) c.telemetry_port = y["telemetry"]["port"].as<int>();

  return c;
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping current level", level);
  }
}
