#include <verity/server/server.hpp>
#include <verity/server/handlers.hpp>
#include <verity/shutdown.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <stdexcept>
#include <thread>

namespace verity::server {

Server::Server(const Config& config) : config_(config) {
  config_.Validate();
  trantor::Logger::setLogLevel(ParseLogLevel(config_.server.log_level));

  // Detector metrics land in the same sink the /metrics endpoint exports.
  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
    config_.detector.metrics = metrics_;
  }

  auto status = Detector::Open(config_.detector, &detector_);
  if (!status.ok()) {
    const std::string where =
        config_.detector.db_path.empty() ? std::string("(in-memory)") : config_.detector.db_path;
    throw std::runtime_error("Failed to open detector at " + where + ": " + status.ToString());
  }
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
  if (detector_) {
    detector_->Close();
  }
}

void Server::SetupRoutes() {
  RegisterHandlers(detector_.get(), config_, metrics_, GlobalShutdownHandler().CancelFlag());

  if (metrics_) {
    RegisterMetricsHandler(metrics_, detector_.get(), config_.metrics.path);
  }
}

void Server::SetupShutdown() {
  GlobalShutdownHandler().InstallSignalHandlers();

  GlobalShutdownHandler().OnShutdown([]() {
    LOG_INFO << "Shutting down HTTP server...";
    drogon::app().quit();
  });
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();
  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;
  }
  app.setThreadNum(threads);

  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  app.disableSession();

  SetupRoutes();
  SetupShutdown();

  const Statistics stats = detector_->GetStatistics();
  LOG_INFO << "Verity server starting on " << config_.server.host << ":"
           << config_.server.port << " with " << threads << " threads, "
           << stats.total_documents << " documents loaded";

  app.run();

  running_ = false;
  LOG_INFO << "Server stopped.";
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownHandler().Shutdown();
  }
}

}  // namespace verity::server
