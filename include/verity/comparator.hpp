#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <verity/types.hpp>

namespace verity {

/** Fusion weights; they sum to 1. */
struct FusionWeights {
  static constexpr double kFuzzy = 0.20;
  static constexpr double kTfidf = 0.30;
  static constexpr double kSemantic = 0.25;
  static constexpr double kStructural = 0.15;
  static constexpr double kVisual = 0.05;
  static constexpr double kMetadata = 0.05;
};

/** Classification cut-offs on the fused score and on joint components. */
struct ClassificationThresholds {
  static constexpr double kExact = 0.95;
  static constexpr double kNearExact = 0.85;
  static constexpr double kVersionStructural = 0.8;
  static constexpr double kVersionTfidf = 0.6;
  static constexpr double kTemplateStructural = 0.9;
  static constexpr double kTemplateTfidf = 0.4;
  static constexpr double kSimilar = 0.7;
  static constexpr double kPartial = 0.4;
  // Pairs fusing below this are never reported.
  static constexpr double kReportingFloor = 0.3;
};

/**
 * Pure pairwise scoring of two fingerprints.
 *
 * Stateless and deterministic: Compare(a, b) and Compare(b, a) produce the
 * same numbers, with ids in canonical (ascending) order.
 */
class Comparator {
 public:
  /** All component scores plus the fused score, with no reporting floor. */
  static SimilarityBreakdown Score(const DocumentFingerprint& a, const DocumentFingerprint& b);

  /**
   * Score and classify a pair. Returns nullopt when the fused score is below
   * the reporting floor. `timestamp_us` is stamped on the match.
   */
  static std::optional<DuplicateMatch> Compare(const DocumentFingerprint& a,
                                               const DocumentFingerprint& b,
                                               uint64_t timestamp_us);

  /** Same as above, stamped with the current wall clock. */
  static std::optional<DuplicateMatch> Compare(const DocumentFingerprint& a,
                                               const DocumentFingerprint& b);

  /** Build the match for an already computed breakdown (nullopt below floor). */
  static std::optional<DuplicateMatch> FromBreakdown(const DocumentFingerprint& a,
                                                     const DocumentFingerprint& b,
                                                     const SimilarityBreakdown& scores,
                                                     uint64_t timestamp_us);

  // Component scores, each in [0,1].
  static double FuzzySimilarity(std::string_view hash_a, std::string_view hash_b);
  static double SemanticSimilarity(const std::optional<std::vector<float>>& a,
                                   const std::optional<std::vector<float>>& b);
  static double VisualSimilarity(const std::optional<std::string>& a,
                                 const std::optional<std::string>& b);
  static double MetadataSimilarity(std::string_view hash_a, std::string_view hash_b);

  static double Fuse(const SimilarityBreakdown& s);
  static DuplicateType Classify(const SimilarityBreakdown& s);

  /**
   * Agreement of the four primary signals. Fewer than two non-zero signals
   * give 0.5; otherwise max(0.1, 1 - 2 * stddev), plus 0.2 (capped at 1.0)
   * when their mean is at least 0.8.
   */
  static double Confidence(const SimilarityBreakdown& s);

  /** Largest of fuzzy, tfidf, semantic, structural; earlier wins ties. */
  static SimilarityMethod PrimaryMethod(const SimilarityBreakdown& s);
};

}  // namespace verity
