#pragma once

#include <verity/detector.hpp>

#include <cstdint>
#include <istream>
#include <string>

#include <trantor/utils/Logger.h>

namespace verity::server {

/**
 * HTTP listener configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";

  // Deadline for batch, cluster and dedup requests (0 = none).
  uint32_t batch_timeout_ms = 30000;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 *
 * File format (YAML-like, one level of sections):
 *   server:
 *     port: 8080
 *   detector:
 *     db_path: /var/lib/verity
 *     similarity_threshold: 0.8
 *   metrics:
 *     enabled: true
 */
struct Config {
  ServerConfig server;
  verity::Options detector;
  MetricsConfig metrics;

  /**
   * Load configuration from a file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration text.
   * @throws std::runtime_error on unknown sections, keys or bad values.
   */
  static Config LoadFromStream(std::istream& in);

  /**
   * Parse command-line arguments. A --config file is read first and the
   * other flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

/**
 * Map "debug", "info", "warn" or "error" to a trantor log level.
 * @throws std::runtime_error for other names.
 */
trantor::Logger::LogLevel ParseLogLevel(const std::string& name);

}  // namespace verity::server
