#include <verity/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace verity::server {

namespace {

// Histogram buckets for HTTP latency (in milliseconds)
const std::vector<double> kLatencyMsBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

// Detector latencies are reported in microseconds
const std::vector<double> kLatencyUsBuckets = {
    10, 50, 100, 500, 1000, 5000, 10000, 50000, 100000, 500000, 1000000, 5000000};

// Sizes and counts
const std::vector<double> kCountBuckets = {
    1, 2, 5, 10, 50, 100, 500, 1000, 5000, 10000, 100000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

bool EndsWith(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void WriteHistogram(std::ostringstream& out, const std::string& name,
                    const std::vector<double>& bounds, const std::vector<uint64_t>& buckets,
                    double sum, uint64_t count) {
  out << "# TYPE " << name << " histogram\n";
  for (size_t i = 0; i < bounds.size(); ++i) {
    out << name << "_bucket{le=\"" << bounds[i] << "\"} " << buckets[i] << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} " << buckets.back() << "\n";
  out << name << "_sum " << sum << "\n";
  out << name << "_count " << count << "\n";
}

}  // namespace

// --- PrometheusMetrics ---

std::string PrometheusMetrics::SanitizeName(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == ':';
    out.push_back(ok ? c : '_');
  }
  if (!out.empty() && out[0] >= '0' && out[0] <= '9') out.insert(out.begin(), '_');
  return out;
}

const std::vector<double>& PrometheusMetrics::BoundsFor(const std::string& name) {
  if (EndsWith(name, "_us")) return kLatencyUsBuckets;
  if (EndsWith(name, "_ms")) return kLatencyMsBuckets;
  return kCountBuckets;
}

void PrometheusMetrics::Observe(HistogramData* h, const std::vector<double>& bounds,
                                double value) {
  if (h->buckets.empty()) {
    h->buckets.resize(bounds.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, bounds);
  for (size_t i = bucket; i < h->buckets.size(); ++i) {
    h->buckets[i]++;
  }
  h->count++;
  h->sum += value;
}

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::string key = SanitizeName(name);
  std::lock_guard<std::mutex> lock(mu_);
  counters_[key] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::string key = SanitizeName(name);
  std::lock_guard<std::mutex> lock(mu_);
  Observe(&histograms_[key], BoundsFor(key), static_cast<double>(value));
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::string key = SanitizeName(name);
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[key] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& route,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  http_requests_[std::make_tuple(method, route, status_code)]++;
  Observe(&http_latency_, kLatencyMsBuckets, latency_ms);
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  for (const auto& [name, value] : counters_) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, value] : gauges_) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, data] : histograms_) {
    WriteHistogram(out, name, BoundsFor(name), data.buckets, data.sum, data.count);
  }

  if (!http_requests_.empty()) {
    out << "# TYPE verity_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "verity_http_requests_total{method=\"" << std::get<0>(key)
          << "\",route=\"" << std::get<1>(key) << "\",status=\"" << std::get<2>(key)
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    WriteHistogram(out, "verity_http_request_duration_ms", kLatencyMsBuckets,
                   http_latency_.buckets, http_latency_.sum, http_latency_.count);
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            verity::Detector* detector,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics, detector](const drogon::HttpRequestPtr& req,
                          std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        (void)req;
        if (detector) {
          const Statistics stats = detector->GetStatistics();
          metrics->Gauge("verity_documents", static_cast<double>(stats.total_documents));
          metrics->Gauge("verity_cache_entries", static_cast<double>(stats.cached_comparisons));
          metrics->Gauge("verity_tfidf_vocabulary_size",
                         static_cast<double>(stats.tfidf_vocabulary_size));
          metrics->Gauge("verity_semantic_vectors", static_cast<double>(stats.semantic_vectors));
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string route)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      route_(std::move(route)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
    double latency_ms = static_cast<double>(duration.count()) / 1000.0;
    metrics_->RecordHttpRequest(method_, route_, status_code_, latency_ms);
  }
}

}  // namespace verity::server
