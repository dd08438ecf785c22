#pragma once

#include <verity/detector.hpp>
#include <verity/server/config.hpp>
#include <verity/server/metrics.hpp>

#include <memory>
#include <string>

namespace verity::server {

/**
 * Verity HTTP Server.
 *
 * Wraps a verity::Detector with a REST API using Drogon: documents are
 * fingerprinted with PUT, and duplicates, clusters and dedup decisions are
 * queried over the registered corpus.
 */
class Server {
 public:
  /**
   * Validate `config`, apply its log level and open the detector.
   * @throws std::runtime_error if the configuration is invalid or the
   * detector cannot be opened.
   */
  explicit Server(const Config& config);

  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async). Running bulk requests are aborted.
   */
  void Shutdown();

  Detector* GetDetector() { return detector_.get(); }
  const Detector* GetDetector() const { return detector_.get(); }

 private:
  void SetupRoutes();
  void SetupShutdown();

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::unique_ptr<Detector> detector_;
  bool running_ = false;
};

}  // namespace verity::server
