#include "metrics.hpp"

#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.capture_p50 = capture_.perc(50); s.capture_p95 = capture_.perc(95); s.capture_p99 = capture_.perc(99);
  s.infer_p50 = infer_.perc(50);     s.infer_p95 = infer_.perc(95);     s.infer_p99 = infer_.perc(99);
  s.frames_captured = frames_captured_.load();
  s.frames_dropped = frames_dropped_.load();
  s.inference_failures = inference_failures_.load();
  s.write_failures = write_failures_.load();
  s.conversions_ok = conversions_ok_.load();
  s.conversions_failed = conversions_failed_.load();
  s.uploads_failed = uploads_failed_.load();
  s.drop_rate = s.frames_captured
                    ? static_cast<double>(s.frames_dropped) / static_cast<double>(s.frames_captured)
                    : 0.0;
  s.fps = fps_.load();
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "capture_ms{quantile=\"0.5\"} "  << s.capture_p50 << "\n";
  os << "capture_ms{quantile=\"0.95\"} " << s.capture_p95 << "\n";
  os << "capture_ms{quantile=\"0.99\"} " << s.capture_p99 << "\n";
  os << "inference_ms{quantile=\"0.5\"} "  << s.infer_p50 << "\n";
  os << "inference_ms{quantile=\"0.95\"} " << s.infer_p95 << "\n";
  os << "inference_ms{quantile=\"0.99\"} " << s.infer_p99 << "\n";

  os << "frames_captured_total " << s.frames_captured << "\n";
  os << "frames_dropped_total " << s.frames_dropped << "\n";
  os << "inference_failures_total " << s.inference_failures << "\n";
  os << "recording_write_failures_total " << s.write_failures << "\n";
  os << "conversions_total{result=\"ok\"} " << s.conversions_ok << "\n";
  os << "conversions_total{result=\"failed\"} " << s.conversions_failed << "\n";
  os << "uploads_failed_total " << s.uploads_failed << "\n";

  os << "frame_drop_rate " << s.drop_rate << "\n";
  os << "capture_fps " << s.fps << "\n";
  return os.str();
}
