#include <verity/server/handlers.hpp>

#include <drogon/drogon.h>
#include <json/json.h>

#include <chrono>
#include <sstream>

#include <verity/json.hpp>

namespace verity::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

drogon::HttpResponsePtr JsonResponse(const Json::Value& json, drogon::HttpStatusCode code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

drogon::HttpResponsePtr BadRequest(const std::string& message) {
  Json::Value error;
  error["error"] = "invalid_argument";
  error["code"] = 400;
  error["message"] = message;
  return JsonResponse(error, drogon::k400BadRequest);
}

void Reply(const Callback& callback, RequestTimer* timer, const drogon::HttpResponsePtr& resp) {
  timer->SetStatusCode(static_cast<int>(resp->statusCode()));
  callback(resp);
}

// Parse the request body as JSON. An empty body is an empty object when
// `allow_empty` is set.
bool ReadBody(const drogon::HttpRequestPtr& req, bool allow_empty, Json::Value* out,
              std::string* error) {
  std::string_view body = req->body();
  if (body.empty()) {
    if (!allow_empty) {
      *error = "request body must be a JSON object";
      return false;
    }
    *out = Json::Value(Json::objectValue);
    return true;
  }
  auto json = req->getJsonObject();
  if (json) {
    *out = *json;
  } else if (!ParseJson(body, out, error)) {
    return false;
  }
  if (!out->isObject()) {
    *error = "request body must be a JSON object";
    return false;
  }
  return true;
}

std::vector<std::string> SplitCsv(const std::string& csv) {
  std::vector<std::string> out;
  std::istringstream in(csv);
  std::string item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

}  // namespace

// --- Error Response Helper ---

drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context) {
  Json::Value json;
  int http_code = 500;

  if (status.IsNotFound()) {
    json["error"] = "not_found";
    http_code = 404;
  } else if (status.IsInvalidArgument()) {
    json["error"] = "invalid_argument";
    http_code = 400;
  } else if (status.IsTimedOut()) {
    json["error"] = "timeout";
    http_code = 504;
  } else if (status.IsAborted()) {
    json["error"] = "aborted";
    http_code = 503;
  } else {
    json["error"] = "internal_error";
    http_code = 500;
  }

  json["code"] = http_code;
  json["message"] = context + ": " + status.ToString();
  return JsonResponse(json, static_cast<drogon::HttpStatusCode>(http_code));
}

// --- Handler Registration ---

void RegisterHandlers(Detector* detector,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics,
                      const std::atomic<bool>* cancel) {
  auto& app = drogon::app();
  const auto batch_timeout = std::chrono::milliseconds(config.server.batch_timeout_ms);

  // ==========================================================================
  // Documents
  // ==========================================================================

  // PUT /api/v1/documents/{id} - Fingerprint a document
  app.registerHandler(
      "/api/v1/documents/{id}",
      [detector, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                          const std::string& id) {
        RequestTimer timer(metrics, "PUT", "/api/v1/documents/{id}");

        Json::Value body;
        std::string error;
        if (!ReadBody(req, false, &body, &error)) {
          Reply(callback, &timer, BadRequest(error));
          return;
        }
        if (!body["text"].isString()) {
          Reply(callback, &timer, BadRequest("JSON body must contain a 'text' string"));
          return;
        }
        if (body.isMember("image_ref") && !body["image_ref"].isString()) {
          Reply(callback, &timer, BadRequest("'image_ref' must be a string"));
          return;
        }

        const std::string text = body["text"].asString();
        const std::string image_ref = body.get("image_ref", "").asString();
        FingerprintPtr fp;
        auto status = detector->CreateFingerprint(id, text, body["metadata"], image_ref, &fp);
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Fingerprint failed for '" + id + "'"));
          return;
        }
        Reply(callback, &timer, JsonResponse(FingerprintSummaryToJson(*fp), drogon::k201Created));
      },
      {drogon::Put});

  // GET /api/v1/documents/{id} - Fingerprint summary
  app.registerHandler(
      "/api/v1/documents/{id}",
      [detector, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                          const std::string& id) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/documents/{id}");

        FingerprintPtr fp;
        auto status = detector->GetFingerprint(id, &fp);
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Get failed for '" + id + "'"));
          return;
        }
        Reply(callback, &timer, JsonResponse(FingerprintSummaryToJson(*fp), drogon::k200OK));
      },
      {drogon::Get});

  // DELETE /api/v1/documents/{id} - Forget a document
  app.registerHandler(
      "/api/v1/documents/{id}",
      [detector, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                          const std::string& id) {
        (void)req;
        RequestTimer timer(metrics, "DELETE", "/api/v1/documents/{id}");

        auto status = detector->RemoveFingerprint(id);
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Delete failed for '" + id + "'"));
          return;
        }
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k204NoContent);
        Reply(callback, &timer, resp);
      },
      {drogon::Delete});

  // ==========================================================================
  // Duplicates
  // ==========================================================================

  // GET /api/v1/documents/{id}/duplicates?targets=a,b - Matches for one document
  app.registerHandler(
      "/api/v1/documents/{id}/duplicates",
      [detector, metrics, cancel, batch_timeout](const drogon::HttpRequestPtr& req,
                                                 Callback&& callback, const std::string& id) {
        RequestTimer timer(metrics, "GET", "/api/v1/documents/{id}/duplicates");

        const std::string targets_param = req->getParameter("targets");
        std::vector<std::string> targets = SplitCsv(targets_param);
        const std::vector<std::string>* targets_ptr = targets_param.empty() ? nullptr : &targets;

        std::vector<DuplicateMatch> matches;
        auto status = detector->FindDuplicates(id, targets_ptr, &matches,
                                               RunControl::WithTimeout(batch_timeout, cancel));
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "FindDuplicates failed for '" + id + "'"));
          return;
        }

        Json::Value json;
        json["document_id"] = id;
        json["matches"] = MatchesToJson(matches);
        Reply(callback, &timer, JsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // POST /api/v1/duplicates/batch - All pairs at or above the threshold
  app.registerHandler(
      "/api/v1/duplicates/batch",
      [detector, metrics, cancel, batch_timeout](const drogon::HttpRequestPtr& req,
                                                 Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/duplicates/batch");

        Json::Value body;
        std::vector<std::string> ids;
        bool has_ids = false;
        std::string error;
        if (!ReadBody(req, true, &body, &error) ||
            !ReadStringArray(body, "document_ids", &ids, &has_ids, &error)) {
          Reply(callback, &timer, BadRequest(error));
          return;
        }

        std::vector<DuplicateMatch> matches;
        auto status = detector->BatchDetectDuplicates(
            has_ids ? &ids : nullptr, &matches, RunControl::WithTimeout(batch_timeout, cancel));
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Batch detection failed"));
          return;
        }

        Json::Value json;
        json["matches"] = MatchesToJson(matches);
        Reply(callback, &timer, JsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // POST /api/v1/clusters - Connected duplicate groups
  app.registerHandler(
      "/api/v1/clusters",
      [detector, metrics, cancel, batch_timeout](const drogon::HttpRequestPtr& req,
                                                 Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/clusters");

        Json::Value body;
        std::vector<std::string> ids;
        bool has_ids = false;
        std::string error;
        if (!ReadBody(req, true, &body, &error) ||
            !ReadStringArray(body, "document_ids", &ids, &has_ids, &error)) {
          Reply(callback, &timer, BadRequest(error));
          return;
        }

        std::vector<Cluster> clusters;
        auto status = detector->GetDuplicateClusters(
            has_ids ? &ids : nullptr, &clusters, RunControl::WithTimeout(batch_timeout, cancel));
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Clustering failed"));
          return;
        }

        Json::Value json;
        json["clusters"] = ClustersToJson(clusters);
        Reply(callback, &timer, JsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // POST /api/v1/dedup - Keep one document per cluster
  app.registerHandler(
      "/api/v1/dedup",
      [detector, metrics, cancel, batch_timeout](const drogon::HttpRequestPtr& req,
                                                 Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/dedup");

        Json::Value body;
        std::vector<std::string> ids;
        bool has_ids = false;
        std::string error;
        if (!ReadBody(req, true, &body, &error) ||
            !ReadStringArray(body, "document_ids", &ids, &has_ids, &error)) {
          Reply(callback, &timer, BadRequest(error));
          return;
        }

        const Json::Value& strategy_json = body["strategy"];
        if (!strategy_json.isNull() && !strategy_json.isString()) {
          Reply(callback, &timer, BadRequest("'strategy' must be a string"));
          return;
        }
        const std::string strategy_name =
            strategy_json.isNull() ? std::string("newest") : strategy_json.asString();
        KeepStrategy strategy;
        if (!ParseKeepStrategy(strategy_name, &strategy)) {
          Reply(callback, &timer,
                BadRequest("unknown strategy '" + strategy_name +
                           "' (must be newest, oldest, longest or shortest)"));
          return;
        }

        std::vector<std::string> keep;
        std::vector<DedupDecision> decisions;
        auto status = detector->RemoveDuplicates(has_ids ? &ids : nullptr, strategy, &keep,
                                                 &decisions,
                                                 RunControl::WithTimeout(batch_timeout, cancel));
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Dedup failed"));
          return;
        }

        Json::Value json;
        json["strategy"] = strategy_name;
        json["keep"] = StringsToJson(keep);
        json["decisions"] = DecisionsToJson(decisions);
        Reply(callback, &timer, JsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // POST /api/v1/vocabulary/fit - Refit TF-IDF on a corpus
  app.registerHandler(
      "/api/v1/vocabulary/fit",
      [detector, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        RequestTimer timer(metrics, "POST", "/api/v1/vocabulary/fit");

        Json::Value body;
        std::vector<std::string> texts;
        bool has_texts = false;
        std::string error;
        if (!ReadBody(req, false, &body, &error) ||
            !ReadStringArray(body, "texts", &texts, &has_texts, &error)) {
          Reply(callback, &timer, BadRequest(error));
          return;
        }
        if (!has_texts) {
          Reply(callback, &timer, BadRequest("JSON body must contain 'texts'"));
          return;
        }

        size_t vocabulary_size = 0;
        auto status = detector->FitVocabulary(texts, &vocabulary_size);
        if (!status.ok()) {
          Reply(callback, &timer, MakeErrorResponse(status, "Vocabulary fit failed"));
          return;
        }

        Json::Value json;
        json["status"] = "ok";
        json["vocabulary_size"] = static_cast<Json::UInt64>(vocabulary_size);
        Reply(callback, &timer, JsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // ==========================================================================
  // Admin Endpoints
  // ==========================================================================

  // GET /api/v1/stats - Detector statistics
  app.registerHandler(
      "/api/v1/stats",
      [detector, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/stats");
        Reply(callback, &timer,
              JsonResponse(StatisticsToJson(detector->GetStatistics()), drogon::k200OK));
      },
      {drogon::Get});

  // POST /api/v1/admin/clear-cache - Drop every cached score
  app.registerHandler(
      "/api/v1/admin/clear-cache",
      [detector, metrics](const drogon::HttpRequestPtr& req, Callback&& callback) {
        (void)req;
        RequestTimer timer(metrics, "POST", "/api/v1/admin/clear-cache");
        detector->ClearCache();

        Json::Value json;
        json["status"] = "ok";
        Reply(callback, &timer, JsonResponse(json, drogon::k200OK));
      },
      {drogon::Post});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req, Callback&& callback) {
        (void)req;
        Json::Value json;
        json["status"] = "healthy";
        callback(JsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // GET /health/ready - Readiness check with stats
  app.registerHandler(
      "/health/ready",
      [detector, cancel](const drogon::HttpRequestPtr& req, Callback&& callback) {
        (void)req;
        Json::Value json;
        if (cancel && cancel->load()) {
          json["status"] = "shutting_down";
          callback(JsonResponse(json, drogon::k503ServiceUnavailable));
          return;
        }

        const Statistics stats = detector->GetStatistics();
        json["status"] = "healthy";
        json["total_documents"] = static_cast<Json::UInt64>(stats.total_documents);
        json["cached_comparisons"] = static_cast<Json::UInt64>(stats.cached_comparisons);
        json["tfidf_vocabulary_size"] = static_cast<Json::UInt64>(stats.tfidf_vocabulary_size);
        callback(JsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});
}

}  // namespace verity::server
