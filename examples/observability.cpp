#include <verity/detector.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// Prints every metric as it arrives and keeps running totals.
class PrintingMetrics final : public verity::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto& h = hists_[std::string(name)];
    h.first += 1;
    h.second += value;
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lk(mu_);
    gauges_[std::string(name)] = value;
  }

  void Dump(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    os << "\n== Counters ==\n";
    for (const auto& kv : counters_) os << kv.first << " = " << kv.second << "\n";
    os << "\n== Gauges ==\n";
    for (const auto& kv : gauges_) os << kv.first << " = " << kv.second << "\n";
    os << "\n== Histograms (count, avg) ==\n";
    for (const auto& kv : hists_) {
      const double avg = kv.second.first
                             ? static_cast<double>(kv.second.second) / kv.second.first
                             : 0.0;
      os << kv.first << " count=" << kv.second.first << " avg=" << avg << "\n";
    }
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, std::pair<uint64_t, uint64_t>> hists_;
};

class StdoutSpan final : public verity::TraceSpan {
 public:
  explicit StdoutSpan(std::string_view name)
      : name_(name), start_(std::chrono::steady_clock::now()) {}

  void SetAttribute(std::string_view key, uint64_t value) override {
    attrs_.emplace_back(std::string(key), std::to_string(value));
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    attrs_.emplace_back(std::string(key), std::string(value));
  }

  void AddEvent(std::string_view name) override { events_.emplace_back(name); }

  void End(const rocksdb::Status& status) override {
    const auto dur_us = std::chrono::duration_cast<std::chrono::microseconds>(
                            std::chrono::steady_clock::now() - start_)
                            .count();
    std::cout << "[span] " << name_ << " status=" << status.ToString() << " dur_us=" << dur_us;
    for (const auto& kv : attrs_) std::cout << " " << kv.first << "=" << kv.second;
    for (const auto& e : events_) std::cout << " +" << e;
    std::cout << "\n";
  }

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
  std::vector<std::pair<std::string, std::string>> attrs_;
  std::vector<std::string> events_;
};

class StdoutTracer final : public verity::Tracer {
 public:
  std::unique_ptr<verity::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<StdoutSpan>(name);
  }
};

}  // namespace

int main() {
  auto metrics = std::make_shared<PrintingMetrics>();

  verity::Options opt;
  opt.similarity_threshold = 0.3;
  opt.metrics = metrics;
  opt.tracer = std::make_shared<StdoutTracer>();

  std::unique_ptr<verity::Detector> detector;
  auto s = verity::Detector::Open(opt, &detector);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  // A few operations to generate signals.
  const std::string lease = "LEASE AGREEMENT between Landlord and Tenant for the premises.";
  s = detector->CreateFingerprint("lease-a", lease);
  if (!s.ok()) std::cerr << "Fingerprint failed: " << s.ToString() << "\n";
  s = detector->CreateFingerprint("lease-b", lease + " Rent is due monthly.");
  if (!s.ok()) std::cerr << "Fingerprint failed: " << s.ToString() << "\n";

  std::vector<verity::DuplicateMatch> matches;
  // The second sweep is served from the comparison cache.
  for (int round = 0; round < 2; ++round) {
    s = detector->BatchDetectDuplicates(nullptr, &matches);
    if (!s.ok()) std::cerr << "Batch failed: " << s.ToString() << "\n";
  }

  s = detector->FindDuplicates("missing", nullptr, &matches);
  std::cout << "FindDuplicates(missing): " << s.ToString() << "\n";

  metrics->Dump(std::cout);
  return 0;
}
