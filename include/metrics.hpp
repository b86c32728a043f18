#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100], linear interpolation between ranks
  double perc(double p) const {
    std::vector<double> v;
    {
      std::lock_guard<std::mutex> g(mu_);
      if (vals_.empty()) return 0.0;
      v.assign(vals_.begin(), vals_.end());
    }
    std::sort(v.begin(), v.end());
    double rank = (std::clamp(p, 0.0, 100.0) / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double capture_p50{0}, capture_p95{0}, capture_p99{0};
  double infer_p50{0}, infer_p95{0}, infer_p99{0};
  uint64_t frames_captured{0};
  uint64_t frames_dropped{0};
  uint64_t inference_failures{0};
  uint64_t write_failures{0};
  uint64_t conversions_ok{0};
  uint64_t conversions_failed{0};
  uint64_t uploads_failed{0};
  double drop_rate{0};
  double fps{0};
};

class MetricsRegistry {
public:
  void add_capture(double ms) { capture_.add(ms); }
  void add_inference(double ms) { infer_.add(ms); }

  void inc_captured() { frames_captured_.fetch_add(1, std::memory_order_relaxed); }
  void inc_dropped() { frames_dropped_.fetch_add(1, std::memory_order_relaxed); }
  void inc_inference_failure() { inference_failures_.fetch_add(1, std::memory_order_relaxed); }
  void inc_write_failure() { write_failures_.fetch_add(1, std::memory_order_relaxed); }
  void inc_conversion(bool ok) {
    (ok ? conversions_ok_ : conversions_failed_).fetch_add(1, std::memory_order_relaxed);
  }
  void inc_upload_failure() { uploads_failed_.fetch_add(1, std::memory_order_relaxed); }

  void set_fps(double fps) { fps_.store(fps, std::memory_order_relaxed); }

  uint64_t frames_captured() const { return frames_captured_.load(std::memory_order_relaxed); }
  uint64_t frames_dropped() const { return frames_dropped_.load(std::memory_order_relaxed); }
  uint64_t inference_failures() const {
    return inference_failures_.load(std::memory_order_relaxed);
  }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist capture_, infer_;
  std::atomic<uint64_t> frames_captured_{0};
  std::atomic<uint64_t> frames_dropped_{0};
  std::atomic<uint64_t> inference_failures_{0};
  std::atomic<uint64_t> write_failures_{0};
  std::atomic<uint64_t> conversions_ok_{0};
  std::atomic<uint64_t> conversions_failed_{0};
  std::atomic<uint64_t> uploads_failed_{0};
  std::atomic<double> fps_{0.0};
};
