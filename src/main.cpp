#include <httplib.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "detector.hpp"
#include "frame_store.hpp"
#include "http_stream_transport.hpp"
#include "metrics.hpp"
#include "opencv_codec.hpp"
#include "output_manager.hpp"
#include "pipeline.hpp"
#include "remote_control.hpp"
#include "tensorrt_invoker.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) { g_shutdown = true; }

// Null when the model cannot be used; detection then stays off for the run.
std::unique_ptr<ObjectDetector> build_detector(const DetectorConfig& cfg) {
  LabelMap labels;
  if (!cfg.labels_path.empty()) {
    try {
      labels = LabelMap::fromFile(cfg.labels_path);
    } catch (const std::runtime_error& e) {
      spdlog::warn("{}; using COCO labels", e.what());
    }
  }

  try {
    auto detector = std::make_unique<ObjectDetector>(std::make_unique<TensorRTInvoker>(cfg.engine_path),
                                                     std::make_unique<OpenCvCodec>(), cfg,
                                                     std::move(labels));
    return detector;
  } catch (const ModelLoadError& e) {
    spdlog::error("Object detection unavailable: {}", e.what());
  }
  return nullptr;
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"RoverEye-RT: MJPEG rover camera viewer with on-device object detection"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string host_override;
  cli_app.add_option("--host", host_override, "Car server address (overrides server.host)");

  bool no_detect = false;
  cli_app.add_flag("--no-detect", no_detect, "Start with object detection disabled");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "RoverEye-RT v1.0.0" << std::endl;
    std::cout << "MJPEG stream viewer with TensorRT object detection" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("RoverEye-RT starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const YAML::Exception& e) {
    spdlog::error("Invalid configuration {}: {}", cfg_path, e.what());
    return 1;
  }
  apply_log_level(app.logging.level);
  if (!host_override.empty()) app.server.host = host_override;
  if (no_detect) app.pipeline.scheduler.enabled = false;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  RemoteControl remote({app.server.host, app.server.port, app.server.status_path,
                        app.server.control_path, app.server.status_poll_interval_s});
  nlohmann::json initial_status;
  spdlog::info("Connecting to {}:{}", app.server.host, app.server.port);
  if (!remote.probe(initial_status)) {
    spdlog::error("Connection failed: {}:{} did not answer {}", app.server.host, app.server.port,
                  app.server.status_path);
    return 1;
  }
  spdlog::info("Connected. Server status: {}", initial_status.dump());
  remote.start();

  std::unique_ptr<ObjectDetector> detector = build_detector(app.detector);

  MetricsRegistry metrics;
  FrameStore store;
  HttpStreamTarget target{app.server.host, app.server.port, app.server.video_path,
                          app.server.connect_timeout_s, app.server.connect_timeout_s};
  Pipeline pipe(app.pipeline, std::make_unique<HttpStreamTransport>(target), detector.get(),
                metrics, store);

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    const bool ready = store.status().state == StreamState::Active;
    res.set_content(std::string("{\"ready\":") + (ready ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
    auto s = metrics.snapshot();
    auto status = store.status();
    nlohmann::json j{{"stream_state", to_string(status.state)},
                     {"stream_message", status.message},
                     {"stream_fps", s.stream_fps},
                     {"detection_rate", s.detection_rate},
                     {"detection_enabled", pipe.detection_enabled()},
                     {"detection_available", pipe.detection_available()},
                     {"infer_p50", s.infer_p50},
                     {"infer_p95", s.infer_p95},
                     {"infer_p99", s.infer_p99},
                     {"decode_p50", s.decode_p50},
                     {"decode_p95", s.decode_p95},
                     {"frames_received", s.frames_received},
                     {"payloads_discarded", s.payloads_discarded},
                     {"inference_runs", s.inference_runs},
                     {"decode_failures", s.decode_failures},
                     {"buffer_trims", s.buffer_trims}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    auto s = metrics.snapshot();
    res.set_content(metrics.prometheus_text(s), "text/plain; version=0.0.4");
  });

  svr.Post("/detection/toggle", [&](const httplib::Request&, httplib::Response& res) {
    if (!pipe.detection_available()) {
      res.status = 409;
      res.set_content("{\"error\":\"no usable model\"}", "application/json");
      return;
    }
    pipe.set_detection_enabled(!pipe.detection_enabled());
    nlohmann::json j{{"detection_enabled", pipe.detection_enabled()}};
    res.set_content(j.dump(), "application/json");
  });

  svr.Post(R"(/drive/(\w+))", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string direction = req.matches[1];
    if (!remote.send_command(direction)) {
      res.status = 400;
      res.set_content("{\"queued\":false}", "application/json");
      return;
    }
    res.set_content("{\"queued\":true}", "application/json");
  });

  svr.Get("/remote/status", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j{{"ok", remote.status_ok()}, {"status", remote.last_status()}};
    res.set_content(j.dump(2), "application/json");
  });

  std::thread server_thread([&] {
    spdlog::info("HTTP server listening on 0.0.0.0:{}", app.telemetry_port);
    if (!svr.listen("0.0.0.0", app.telemetry_port)) {
      spdlog::error("HTTP server failed to bind port {}", app.telemetry_port);
    }
  });

  pipe.start();

  {
    OutputManager output(app.display, app.logging, metrics);
    const auto period = std::chrono::milliseconds(std::max(1, app.display.refresh_ms));
    auto next_tick = std::chrono::steady_clock::now();
    while (!g_shutdown) {
      if (!output.tick(store.snapshot(), pipe.detection_enabled())) {
        spdlog::info("Display window closed");
        break;
      }
      next_tick += period;
      std::this_thread::sleep_until(next_tick);
    }
  }

  // Cleanup
  pipe.stop();
  remote.stop();
  svr.stop();
  if (server_thread.joinable()) server_thread.join();
  spdlog::info("Shutdown complete.");
  return 0;
}
