// Server tests for verity HTTP server
// Tests: Config parsing, Prometheus metrics, and error responses

#include <gtest/gtest.h>

#include <verity/server/config.hpp>
#include <verity/server/handlers.hpp>
#include <verity/server/metrics.hpp>

#include <drogon/drogon.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace verity::server {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() / ("verity_server_test_" + RandomSuffix());
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::filesystem::path path() const { return path_; }

 private:
  std::filesystem::path path_;
};

Config Parse(const std::string& text) {
  std::istringstream in(text);
  return Config::LoadFromStream(in);
}

// =============================================================================
// Config Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
 protected:
  TempDir temp_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
  Config config;
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.server.threads, 0u);
  EXPECT_EQ(config.server.log_level, "info");
  EXPECT_EQ(config.server.batch_timeout_ms, 30000u);
  EXPECT_TRUE(config.detector.db_path.empty());
  EXPECT_DOUBLE_EQ(config.detector.similarity_threshold, 0.8);
  EXPECT_EQ(config.detector.normalization, NormalizationMode::kLowercase);
  EXPECT_TRUE(config.metrics.enabled);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, LoadFromStream_Sections) {
  auto config = Parse(
      "# verity\n"
      "server:\n"
      "  port: 9000\n"
      "  log_level: \"debug\"\n"
      "  batch_timeout_ms: 500\n"
      "detector:\n"
      "  db_path: /var/lib/verity\n"
      "  similarity_threshold: 0.65\n"
      "  normalization: unicode\n"
      "  comparison_threads: 4\n"
      "  sync_writes: yes\n"
      "metrics:\n"
      "  enabled: false\n");
  EXPECT_EQ(config.server.port, 9000);
  EXPECT_EQ(config.server.log_level, "debug");
  EXPECT_EQ(config.server.batch_timeout_ms, 500u);
  EXPECT_EQ(config.detector.db_path, "/var/lib/verity");
  EXPECT_DOUBLE_EQ(config.detector.similarity_threshold, 0.65);
  EXPECT_EQ(config.detector.normalization, NormalizationMode::kUnicode);
  EXPECT_EQ(config.detector.comparison_threads, 4);
  EXPECT_TRUE(config.detector.sync_writes);
  EXPECT_FALSE(config.metrics.enabled);
}

TEST_F(ConfigTest, LoadFromStream_TopLevelDbPath) {
  auto config = Parse("db_path: '/data/verity'\n");
  EXPECT_EQ(config.detector.db_path, "/data/verity");
}

TEST_F(ConfigTest, LoadFromStream_Errors) {
  EXPECT_THROW(Parse("cache:\n"), std::runtime_error);
  EXPECT_THROW(Parse("server:\n  colour: blue\n"), std::runtime_error);
  EXPECT_THROW(Parse("server:\n  port: 70000\n"), std::runtime_error);
  EXPECT_THROW(Parse("server:\n  port: -1\n"), std::runtime_error);
  EXPECT_THROW(Parse("detector:\n  similarity_threshold: high\n"), std::runtime_error);
  EXPECT_THROW(Parse("detector:\n  normalization: nfkc\n"), std::runtime_error);
  EXPECT_EQ(Parse("detector:\n  normalization: lowercase\n").detector.normalization,
            NormalizationMode::kLowercase);
  EXPECT_THROW(Parse("metrics:\n  enabled: maybe\n"), std::runtime_error);
  EXPECT_THROW(Parse("just some words\n"), std::runtime_error);
  EXPECT_THROW(Parse("threshold: 0.5\n"), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile) {
  auto path = temp_dir_.path() / "verity.yaml";
  {
    std::ofstream out(path);
    out << "server:\n  port: 8181\ndetector:\n  semantic_model_type: bge-small\n";
  }
  auto config = Config::LoadFromFile(path.string());
  EXPECT_EQ(config.server.port, 8181);
  EXPECT_EQ(config.detector.semantic_model_type, EmbedderModelType::kBGESmall);

  EXPECT_THROW(Config::LoadFromFile((temp_dir_.path() / "missing.yaml").string()),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_Flags) {
  const char* argv[] = {"verity_server", "--db-path", "/data/test", "--port", "9090",
                        "--host", "127.0.0.1", "--threshold", "0.9", "--no-metrics"};
  auto config = Config::LoadFromArgs(10, const_cast<char**>(argv));
  EXPECT_EQ(config.detector.db_path, "/data/test");
  EXPECT_EQ(config.server.port, 9090);
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_DOUBLE_EQ(config.detector.similarity_threshold, 0.9);
  EXPECT_FALSE(config.metrics.enabled);
}

TEST_F(ConfigTest, LoadFromArgs_FlagsOverrideConfigFile) {
  auto path = (temp_dir_.path() / "verity.yaml").string();
  {
    std::ofstream out(path);
    out << "server:\n  port: 7000\n  threads: 2\n";
  }
  const char* argv[] = {"verity_server", "-p", "7001", "--config", path.c_str()};
  auto config = Config::LoadFromArgs(5, const_cast<char**>(argv));
  EXPECT_EQ(config.server.port, 7001);
  EXPECT_EQ(config.server.threads, 2u);
}

TEST_F(ConfigTest, LoadFromArgs_Errors) {
  const char* unknown[] = {"verity_server", "--unknown-option"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(unknown)), std::runtime_error);

  const char* missing[] = {"verity_server", "--port"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(missing)), std::runtime_error);
}

TEST_F(ConfigTest, Validate) {
  Config config;
  config.server.port = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.detector.similarity_threshold = 1.2;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.detector.registry_shards = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.detector.collaborator_threads = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.detector.max_abandoned_collaborator_calls = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.metrics.path = "metrics";
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config = Config{};
  config.server.log_level = "verbose";
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, ParseLogLevel) {
  EXPECT_EQ(ParseLogLevel("debug"), trantor::Logger::kDebug);
  EXPECT_EQ(ParseLogLevel("info"), trantor::Logger::kInfo);
  EXPECT_EQ(ParseLogLevel("warn"), trantor::Logger::kWarn);
  EXPECT_EQ(ParseLogLevel("error"), trantor::Logger::kError);
  EXPECT_THROW(ParseLogLevel("INFO"), std::runtime_error);
}

// =============================================================================
// Metrics Tests
// =============================================================================

TEST(PrometheusMetricsTest, SanitizeName) {
  EXPECT_EQ(PrometheusMetrics::SanitizeName("verity.cache.hit_total"), "verity_cache_hit_total");
  EXPECT_EQ(PrometheusMetrics::SanitizeName("a-b c:d"), "a_b_c:d");
  EXPECT_EQ(PrometheusMetrics::SanitizeName("9lives"), "_9lives");
}

TEST(PrometheusMetricsTest, ExportCounterAndGauge) {
  PrometheusMetrics metrics;
  metrics.Counter("verity.cache.hit_total", 2);
  metrics.Counter("verity.cache.hit_total", 3);
  metrics.Gauge("verity.registry.documents", 7);

  const std::string out = metrics.Export();
  EXPECT_NE(out.find("# TYPE verity_cache_hit_total counter\nverity_cache_hit_total 5\n"),
            std::string::npos);
  EXPECT_NE(out.find("# TYPE verity_registry_documents gauge\n"), std::string::npos);
  EXPECT_NE(out.find("verity_registry_documents 7.000000\n"), std::string::npos);
}

TEST(PrometheusMetricsTest, ExportHistogramUsesLatencyBuckets) {
  PrometheusMetrics metrics;
  metrics.Histogram("verity.batch.latency_us", 75);
  metrics.Histogram("verity.batch.latency_us", 2000000);

  const std::string out = metrics.Export();
  EXPECT_NE(out.find("# TYPE verity_batch_latency_us histogram"), std::string::npos);
  EXPECT_NE(out.find("verity_batch_latency_us_bucket{le=\"50.000000\"} 0\n"), std::string::npos);
  EXPECT_NE(out.find("verity_batch_latency_us_bucket{le=\"100.000000\"} 1\n"), std::string::npos);
  EXPECT_NE(out.find("verity_batch_latency_us_bucket{le=\"+Inf\"} 2\n"), std::string::npos);
  EXPECT_NE(out.find("verity_batch_latency_us_count 2\n"), std::string::npos);
}

TEST(PrometheusMetricsTest, HttpRequestsByRoute) {
  PrometheusMetrics metrics;
  metrics.RecordHttpRequest("GET", "/api/v1/documents/{id}", 404, 1.5);
  metrics.RecordHttpRequest("GET", "/api/v1/documents/{id}", 404, 0.7);

  const std::string out = metrics.Export();
  EXPECT_NE(out.find("verity_http_requests_total{method=\"GET\",route=\"/api/v1/documents/{id}\","
                     "status=\"404\"} 2\n"),
            std::string::npos);
  EXPECT_NE(out.find("verity_http_request_duration_ms_count 2\n"), std::string::npos);
}

TEST(PrometheusMetricsTest, EmptyExport) {
  PrometheusMetrics metrics;
  EXPECT_TRUE(metrics.Export().empty());
}

TEST(PrometheusMetricsTest, RequestTimerRecordsStatus) {
  auto metrics = std::make_shared<PrometheusMetrics>();
  {
    RequestTimer timer(metrics, "POST", "/api/v1/clusters");
    timer.SetStatusCode(504);
  }
  EXPECT_NE(metrics->Export().find("route=\"/api/v1/clusters\",status=\"504\"} 1"),
            std::string::npos);
}

// =============================================================================
// Error Response Tests
// =============================================================================

TEST(ErrorResponseTest, StatusMapping) {
  struct Case {
    rocksdb::Status status;
    drogon::HttpStatusCode code;
    const char* error;
  };
  const Case cases[] = {
      {rocksdb::Status::NotFound("x"), drogon::k404NotFound, "not_found"},
      {rocksdb::Status::InvalidArgument("x"), drogon::k400BadRequest, "invalid_argument"},
      {rocksdb::Status::TimedOut("x"), drogon::k504GatewayTimeout, "timeout"},
      {rocksdb::Status::Aborted("x"), drogon::k503ServiceUnavailable, "aborted"},
      {rocksdb::Status::IOError("x"), drogon::k500InternalServerError, "internal_error"},
  };

  for (const Case& c : cases) {
    auto resp = MakeErrorResponse(c.status, "Batch failed");
    EXPECT_EQ(resp->getStatusCode(), c.code) << c.error;
    auto json = resp->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["error"].asString(), c.error);
    EXPECT_EQ((*json)["code"].asInt(), static_cast<int>(c.code));
    EXPECT_EQ((*json)["message"].asString().rfind("Batch failed: ", 0), 0u);
  }
}

}  // namespace
}  // namespace verity::server
