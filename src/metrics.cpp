#include "metrics.hpp"
#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.decode_p50 = decode_.perc(50); s.decode_p95 = decode_.perc(95);
  s.infer_p50 = infer_.perc(50);   s.infer_p95 = infer_.perc(95);   s.infer_p99 = infer_.perc(99);
  s.frames_received = frames_.load();
  s.payloads_discarded = discarded_.load();
  s.inference_runs = inferences_.load();
  s.decode_failures = decode_failures_.load();
  s.buffer_trims = buffer_trims_.load();

  const auto now = Clock::now();
  s.stream_fps = frame_rate_.rate(now);
  s.detection_rate = inference_rate_.rate(now);
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "rovereye_inference_ms{quantile=\"0.5\"} "  << s.infer_p50 << "\n";
  os << "rovereye_inference_ms{quantile=\"0.95\"} " << s.infer_p95 << "\n";
  os << "rovereye_inference_ms{quantile=\"0.99\"} " << s.infer_p99 << "\n";
  os << "rovereye_frame_decode_ms{quantile=\"0.5\"} "  << s.decode_p50 << "\n";
  os << "rovereye_frame_decode_ms{quantile=\"0.95\"} " << s.decode_p95 << "\n";

  os << "rovereye_stream_frames_total " << s.frames_received << "\n";
  os << "rovereye_stream_payloads_discarded_total " << s.payloads_discarded << "\n";
  os << "rovereye_stream_buffer_trims_total " << s.buffer_trims << "\n";
  os << "rovereye_inference_runs_total " << s.inference_runs << "\n";
  os << "rovereye_frame_decode_failures_total " << s.decode_failures << "\n";

  os << "rovereye_stream_fps " << s.stream_fps << "\n";
  os << "rovereye_detection_runs_per_second " << s.detection_rate << "\n";
  return os.str();
}
