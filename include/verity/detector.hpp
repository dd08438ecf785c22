#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <json/json.h>
#include <rocksdb/status.h>

#include <verity/comparison_cache.hpp>
#include <verity/embedder.hpp>
#include <verity/normalize.hpp>
#include <verity/run_control.hpp>
#include <verity/types.hpp>

namespace verity {

class CandidateIndex;
class FingerprintBuilder;
class FingerprintRegistry;
class FingerprintStore;
class TfidfVectorizer;

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, cache hits, evictions). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, pair counts). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., registry size). No-op by default. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const rocksdb::Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Options for the duplicate detector.
 */
struct Options {
  // Minimum fused score reported by FindDuplicates / BatchDetectDuplicates.
  double similarity_threshold = 0.8;

  // Text normalization applied before content hashing.
  NormalizationMode normalization = NormalizationMode::kLowercase;

  // ---------------------------------------------------------------------------
  // Collaborators
  // ---------------------------------------------------------------------------

  // Optional embedding and perceptual-hash providers. Calls are bounded by
  // the timeouts below; a failure or timeout leaves the signal absent.
  std::shared_ptr<Embedder> embedder;
  std::shared_ptr<ImageHasher> image_hasher;

  // Text is truncated to this many code points before embedding.
  size_t semantic_max_chars = 512;

  int embed_timeout_ms = 2000;       // 0 = call inline, no bound
  int image_hash_timeout_ms = 2000;

  // Threads serving embedder and image hasher calls. A timed-out call keeps
  // its thread until it returns; while this many are still running, further
  // calls are skipped and the signal is left absent.
  int collaborator_threads = 2;
  int max_abandoned_collaborator_calls = 2;

  // ONNX model to load when `embedder` is unset (VERITY_ENABLE_SEMANTIC
  // builds only). vocab.txt is expected next to it.
  std::string semantic_model_path;
  EmbedderModelType semantic_model_type = EmbedderModelType::kMiniLM;
  int semantic_num_threads = 0;

  // ---------------------------------------------------------------------------
  // Comparison
  // ---------------------------------------------------------------------------

  // Worker threads for BatchDetectDuplicates (0 = hardware concurrency).
  int comparison_threads = 1;

  size_t cache_shards = 16;
  size_t registry_shards = 16;

  // TF-IDF vectorizer
  size_t tfidf_max_features = 10000;
  int tfidf_ngram_max = 3;

  // Restrict batch detection to pairs proposed by an HNSW index over the
  // semantic vectors (requires VERITY_ENABLE_SEMANTIC). Documents without a
  // vector and documents sharing a content hash are always compared.
  bool use_candidate_index = false;
  int candidate_k = 10;
  int hnsw_m = 16;
  int hnsw_ef_construction = 200;
  int hnsw_ef_search = 50;

  // ---------------------------------------------------------------------------
  // Persistence
  // ---------------------------------------------------------------------------

  // RocksDB directory for fingerprints and the TF-IDF vocabulary.
  // Empty = in-memory only.
  std::string db_path;
  bool sync_writes = false;

  // Observability hooks (optional)
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/**
 * verity::Detector
 *
 * Fingerprints documents and finds duplicates among them:
 * - CreateFingerprint() builds and registers a document's signatures.
 * - FindDuplicates() / BatchDetectDuplicates() score pairs through a
 *   revision-checked ComparisonCache.
 * - GetDuplicateClusters() / RemoveDuplicates() group and resolve them.
 *
 * All methods are thread-safe. Bulk calls work on a snapshot of the registry
 * taken when they start.
 */
class Detector {
 public:
  ~Detector();

  Detector(const Detector&) = delete;
  Detector& operator=(const Detector&) = delete;

  /**
   * Validate options and build a detector. When db_path is set, opens the
   * fingerprint store and loads every stored fingerprint and the vocabulary.
   */
  static rocksdb::Status Open(const Options& opt, std::unique_ptr<Detector>* out);

  /**
   * Fingerprint `text` under `document_id`, replacing any previous
   * fingerprint and evicting every cached score involving the id.
   * `metadata` should be a JSON object (null = {}). `out` may be null.
   */
  rocksdb::Status CreateFingerprint(std::string_view document_id,
                                    std::string_view text,
                                    const Json::Value& metadata = Json::Value(),
                                    std::string_view image_ref = {},
                                    FingerprintPtr* out = nullptr);

  /** Refit the TF-IDF vocabulary. Existing vectors stop comparing with new ones. */
  rocksdb::Status FitVocabulary(const std::vector<std::string>& texts,
                                size_t* vocabulary_size = nullptr);

  rocksdb::Status GetFingerprint(std::string_view document_id, FingerprintPtr* out) const;

  /** Forget a document everywhere (registry, cache, store, index). */
  rocksdb::Status RemoveFingerprint(std::string_view document_id);

  /**
   * Score one pair. *out is nullopt when the fused score is below the
   * reporting floor. Uses and refreshes the cache.
   */
  rocksdb::Status Compare(std::string_view id1, std::string_view id2,
                          std::optional<DuplicateMatch>* out);

  /**
   * Matches of `document_id` against `targets` (null = every other
   * document) scoring at least similarity_threshold, best first.
   */
  rocksdb::Status FindDuplicates(std::string_view document_id,
                                 const std::vector<std::string>* targets,
                                 std::vector<DuplicateMatch>* out,
                                 const RunControl& ctl = RunControl{});

  /** Every pair among `document_ids` (null = all) at or above the threshold. */
  rocksdb::Status BatchDetectDuplicates(const std::vector<std::string>* document_ids,
                                        std::vector<DuplicateMatch>* out,
                                        const RunControl& ctl = RunControl{});

  rocksdb::Status GetDuplicateClusters(const std::vector<std::string>* document_ids,
                                       std::vector<Cluster>* out,
                                       const RunControl& ctl = RunControl{});

  /**
   * Keep one document per duplicate cluster. *keep receives the sorted ids
   * of `document_ids` (null = all) that survive; `decisions` may be null.
   */
  rocksdb::Status RemoveDuplicates(const std::vector<std::string>* document_ids,
                                   KeepStrategy strategy,
                                   std::vector<std::string>* keep,
                                   std::vector<DedupDecision>* decisions = nullptr,
                                   const RunControl& ctl = RunControl{});

  Statistics GetStatistics() const;

  void ClearCache();

  /**
   * Release the store. Later calls fail with InvalidArgument. Must not race
   * with other calls on this detector.
   */
  void Close();

  const Options& options() const { return opt_; }

 private:
  explicit Detector(const Options& opt);

  rocksdb::Status LoadFromStore();

  // Score one pair through the cache. nullopt when the pair scores below
  // `min_score` (or the reporting floor).
  std::optional<DuplicateMatch> ComparePair(const FingerprintPtr& a,
                                            const FingerprintPtr& b,
                                            double min_score,
                                            uint64_t timestamp_us);

  rocksdb::Status ResolveIds(const std::vector<std::string>* document_ids,
                             std::vector<FingerprintPtr>* out) const;

  // For each i, the partners j > i worth comparing. nullopt = every pair.
  std::optional<std::vector<std::vector<size_t>>> CandidateRows(
      const std::vector<FingerprintPtr>& fps) const;

  rocksdb::Status SweepPairs(const std::vector<FingerprintPtr>& fps,
                             std::vector<DuplicateMatch>* out,
                             const RunControl& ctl);

  void IndexFingerprint(const DocumentFingerprint& fp);
  void UnindexFingerprint(const std::string& document_id);

  Options opt_;
  std::atomic<bool> closed_{false};

  std::unique_ptr<TfidfVectorizer> vectorizer_;
  std::unique_ptr<FingerprintBuilder> builder_;
  std::unique_ptr<FingerprintRegistry> registry_;
  std::unique_ptr<ComparisonCache> cache_;
  std::unique_ptr<FingerprintStore> store_;

  mutable std::mutex index_mu_;
  std::unique_ptr<CandidateIndex> index_;  // created at the first vector

  std::atomic<uint64_t> comparisons_total_{0};
  std::atomic<uint64_t> cache_hits_total_{0};
  std::atomic<uint64_t> cache_stale_total_{0};
};

}  // namespace verity
