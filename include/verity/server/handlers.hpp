#pragma once

#include <verity/detector.hpp>
#include <verity/server/config.hpp>
#include <verity/server/metrics.hpp>

#include <drogon/HttpAppFramework.h>

#include <atomic>
#include <memory>
#include <string>

namespace verity::server {

/**
 * Create an error response from a RocksDB status:
 * NotFound 404, InvalidArgument 400, TimedOut 504, Aborted 503, other 500.
 */
drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context);

/**
 * Register the document, duplicate, admin and health handlers.
 * Bulk requests run under config.server.batch_timeout_ms and abort once
 * `cancel` is set. `metrics` may be null.
 */
void RegisterHandlers(Detector* detector,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics,
                      const std::atomic<bool>* cancel);

}  // namespace verity::server
