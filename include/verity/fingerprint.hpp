#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <json/json.h>
#include <rocksdb/status.h>

#include <verity/embedder.hpp>
#include <verity/normalize.hpp>
#include <verity/run_control.hpp>
#include <verity/tfidf.hpp>
#include <verity/types.hpp>

namespace verity {

/** Which optional signals degraded while building one fingerprint. */
struct BuildReport {
  bool embed_failed = false;
  bool embed_timed_out = false;
  bool visual_failed = false;
  bool visual_timed_out = false;
  bool metadata_malformed = false;
  bool tfidf_absent = false;
};

/**
 * Turns document text (plus optional metadata and image reference) into an
 * immutable DocumentFingerprint.
 *
 * Never fails because an optional signal is unavailable: embedder or image
 * hasher errors and timeouts, malformed metadata and an unfitted or
 * unmatched TF-IDF vocabulary only leave the corresponding field absent
 * (logged at WARN). The only error is an empty document id.
 *
 * Collaborator calls run on a small worker pool owned by the builder and are
 * bounded by the configured timeouts. A timed-out call finishes in the
 * background and is ignored; once `max_abandoned_calls` of them are still
 * running, further calls are skipped and the signal is left absent.
 */
class FingerprintBuilder {
 public:
  struct Config {
    NormalizationMode normalization = NormalizationMode::kLowercase;
    size_t semantic_max_chars = 512;
    std::chrono::milliseconds embed_timeout{2000};
    std::chrono::milliseconds image_hash_timeout{2000};
    std::shared_ptr<Embedder> embedder;
    std::shared_ptr<ImageHasher> image_hasher;
    size_t collaborator_threads = 2;
    size_t max_abandoned_calls = 2;
  };

  // `vectorizer` must outlive the builder.
  FingerprintBuilder(Config config, TfidfVectorizer* vectorizer);
  ~FingerprintBuilder();

  /**
   * Build a fingerprint. Fits the vectorizer on this document first when no
   * vocabulary exists yet. `report` may be null.
   */
  rocksdb::Status Build(std::string_view document_id,
                        std::string_view text,
                        const Json::Value& metadata,
                        std::string_view image_ref,
                        std::shared_ptr<DocumentFingerprint>* out,
                        BuildReport* report = nullptr) const;

  /** MD5 hex of the normalized text. */
  static std::string ContentHash(std::string_view text, NormalizationMode mode);

  /** SHA-256 hex of the sorted significant words joined by spaces. */
  static std::string FuzzyHash(std::string_view text);

  /**
   * MD5 hex of WriteSortedJson(metadata).
   * Null is treated as {}. Returns an empty string for non-object values.
   */
  static std::string MetadataHash(const Json::Value& metadata);

  /** Next process-wide fingerprint revision. */
  static uint64_t NextRevision();

 private:
  Config config_;
  TfidfVectorizer* vectorizer_;
  std::unique_ptr<internal::CollaboratorPool> pool_;
};

}  // namespace verity
