#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace verity {

/** How two documents relate, from strongest to weakest. */
enum class DuplicateType {
  kExact,         // identical normalized text, or fused score >= 0.95
  kNearExact,     // fused score >= 0.85
  kVersion,       // same structure, shared wording: a revision
  kTemplate,      // same structure, different fill-in data
  kSimilar,       // fused score >= 0.7
  kPartial,       // fused score >= 0.4
  kNotDuplicate
};

/** Similarity signal that dominated a match. */
enum class SimilarityMethod {
  kHash,
  kFuzzy,
  kTfidf,
  kSemantic,
  kStructural,
  kVisual,
  kMetadata
};

/** Which member of a duplicate cluster survives deduplication. */
enum class KeepStrategy {
  kNewest,    // latest created_at
  kOldest,    // earliest created_at
  kLongest,   // most words
  kShortest   // fewest words
};

/** Stable lower-case names ("near_exact", "tfidf", "longest", ...). */
std::string_view DuplicateTypeName(DuplicateType type);
std::string_view SimilarityMethodName(SimilarityMethod method);
std::string_view KeepStrategyName(KeepStrategy strategy);

/** Parse a strategy name. Returns false for unknown names. */
bool ParseKeepStrategy(std::string_view name, KeepStrategy* out);

/** A structural feature is either a flag or a number. */
using FeatureValue = std::variant<bool, double>;
using StructuralFeatures = std::map<std::string, FeatureValue>;

/**
 * L2-normalised sparse TF-IDF vector.
 *
 * `indices` are strictly increasing term ids of the vocabulary identified by
 * `vocabulary_id`. Vectors from different vocabularies are not comparable.
 */
struct SparseVector {
  uint64_t vocabulary_id = 0;
  std::vector<uint32_t> indices;
  std::vector<float> values;

  bool empty() const { return indices.empty(); }
};

/**
 * Immutable per-document signature bundle.
 *
 * Optional signals are either fully present or absent; an absent signal
 * contributes a zero component to every comparison.
 */
struct DocumentFingerprint {
  std::string document_id;
  std::string content_hash;   // MD5 hex of normalized text
  std::string fuzzy_hash;     // SHA-256 hex of sorted significant words
  std::string metadata_hash;  // MD5 hex of canonical metadata; empty if malformed
  StructuralFeatures structural_features;
  std::optional<SparseVector> tfidf_vector;
  std::optional<std::vector<float>> semantic_vector;
  std::optional<std::string> visual_hash;
  uint64_t word_count = 0;
  uint64_t char_count = 0;    // Unicode code points
  uint64_t page_count = 1;
  uint64_t created_at_us = 0; // wall clock
  uint64_t revision = 0;      // build order, unique per process
};

using FingerprintPtr = std::shared_ptr<const DocumentFingerprint>;

/** Every component score of one comparison, before the reporting floor. */
struct SimilarityBreakdown {
  bool hash_match = false;
  double fuzzy = 0.0;
  double tfidf = 0.0;
  double semantic = 0.0;
  double structural = 0.0;
  double visual = 0.0;
  double metadata = 0.0;
  double fused = 0.0;
};

struct MatchDetails {
  SimilarityBreakdown scores;
  uint64_t word_count_diff = 0;
  uint64_t page_count_diff = 0;
  bool cached = false;  // a cached score for this pair was confirmed
};

/** A reported pair. document_id_1 < document_id_2 always holds. */
struct DuplicateMatch {
  std::string document_id_1;
  std::string document_id_2;
  DuplicateType duplicate_type = DuplicateType::kNotDuplicate;
  double similarity_score = 0.0;
  double confidence = 0.0;
  SimilarityMethod method_used = SimilarityMethod::kHash;
  MatchDetails details;
  uint64_t timestamp_us = 0;
};

/** Sorted ids of transitively connected duplicates, at least two. */
using Cluster = std::vector<std::string>;

/** Outcome of resolving one cluster. */
struct DedupDecision {
  std::string keeper;
  std::vector<std::string> dropped;  // sorted
};

/** Snapshot returned by Detector::GetStatistics(). */
struct Statistics {
  uint64_t total_documents = 0;
  uint64_t cached_comparisons = 0;
  double similarity_threshold = 0.0;
  std::map<std::string, uint64_t> fingerprint_creation_times;  // id -> created_at_us
  uint64_t semantic_vectors = 0;
  uint64_t visual_hashes = 0;
  uint64_t tfidf_vocabulary_size = 0;
  uint64_t comparisons_total = 0;
  uint64_t cache_hits_total = 0;
  uint64_t cache_stale_total = 0;
};

}  // namespace verity
