#pragma once

#include <verity/detector.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace verity::server {

/**
 * Prometheus-compatible metrics sink.
 *
 * Collects the detector's counters, histograms and gauges plus per-route HTTP
 * request counts, and exports them in Prometheus text exposition format.
 * Names are sanitized on export ("verity.cache.hit_total" becomes
 * "verity_cache_hit_total"); series are written in name order.
 */
class PrometheusMetrics : public verity::MetricsSink {
 public:
  PrometheusMetrics() = default;

  // MetricsSink interface
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /**
   * Record an HTTP request metric. `route` is the registered pattern, not the
   * concrete path, to keep label cardinality bounded.
   */
  void RecordHttpRequest(const std::string& method,
                         const std::string& route,
                         int status_code,
                         double latency_ms);

  /** Prometheus-safe form of `name`. */
  static std::string SanitizeName(std::string_view name);

 private:
  struct HistogramData {
    std::vector<uint64_t> buckets;  // cumulative, last = +Inf
    uint64_t count = 0;
    double sum = 0.0;
  };

  static void Observe(HistogramData* h, const std::vector<double>& bounds, double value);
  static const std::vector<double>& BoundsFor(const std::string& name);

  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, HistogramData> histograms_;
  std::map<std::string, double> gauges_;

  // (method, route, status) -> count
  std::map<std::tuple<std::string, std::string, int>, uint64_t> http_requests_;
  HistogramData http_latency_;
};

/**
 * Register the metrics endpoint with the Drogon app. Registry and cache sizes
 * are refreshed as gauges on every scrape.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            verity::Detector* detector,
                            const std::string& path);

/**
 * RAII helper for timing HTTP requests.
 */
class RequestTimer {
 public:
  RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
               std::string method,
               std::string route);

  ~RequestTimer();

  void SetStatusCode(int code) { status_code_ = code; }

 private:
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::string method_;
  std::string route_;
  int status_code_ = 200;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace verity::server
