#include <verity/comparator.hpp>

#include <algorithm>
#include <cmath>
#include <initializer_list>

#include <verity/features.hpp>
#include <verity/internal.hpp>
#include <verity/tfidf.hpp>

namespace verity {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

uint64_t AbsDiff(uint64_t x, uint64_t y) { return x > y ? x - y : y - x; }

}  // namespace

double Comparator::FuzzySimilarity(std::string_view hash_a, std::string_view hash_b) {
  if (hash_a.empty() || hash_b.empty() || hash_a.size() != hash_b.size()) return 0.0;
  size_t mismatched = 0;
  for (size_t i = 0; i < hash_a.size(); ++i) {
    if (hash_a[i] != hash_b[i]) ++mismatched;
  }
  return 1.0 - static_cast<double>(mismatched) / static_cast<double>(hash_a.size());
}

double Comparator::SemanticSimilarity(const std::optional<std::vector<float>>& a,
                                      const std::optional<std::vector<float>>& b) {
  if (!a || !b) return 0.0;
  return std::max(0.0, internal::CosineSimilarity(*a, *b));
}

double Comparator::VisualSimilarity(const std::optional<std::string>& a,
                                    const std::optional<std::string>& b) {
  if (!a || !b || a->empty() || a->size() != b->size()) return 0.0;

  uint64_t distance = 0;
  for (size_t i = 0; i < a->size(); ++i) {
    const int x = HexNibble((*a)[i]);
    const int y = HexNibble((*b)[i]);
    if (x < 0 || y < 0) return 0.0;
    distance += static_cast<uint64_t>(__builtin_popcount(static_cast<unsigned>(x ^ y)));
  }
  const double max_distance = 4.0 * static_cast<double>(a->size());
  return std::max(0.0, 1.0 - static_cast<double>(distance) / max_distance);
}

double Comparator::MetadataSimilarity(std::string_view hash_a, std::string_view hash_b) {
  return !hash_a.empty() && hash_a == hash_b ? 1.0 : 0.0;
}

double Comparator::Fuse(const SimilarityBreakdown& s) {
  return FusionWeights::kFuzzy * s.fuzzy + FusionWeights::kTfidf * s.tfidf +
         FusionWeights::kSemantic * s.semantic + FusionWeights::kStructural * s.structural +
         FusionWeights::kVisual * s.visual + FusionWeights::kMetadata * s.metadata;
}

SimilarityBreakdown Comparator::Score(const DocumentFingerprint& a, const DocumentFingerprint& b) {
  // Canonical argument order keeps floating point summation identical.
  if (b.document_id < a.document_id) return Score(b, a);

  SimilarityBreakdown s;
  if (!a.content_hash.empty() && a.content_hash == b.content_hash) {
    s.hash_match = true;
    s.fuzzy = s.tfidf = s.semantic = s.structural = s.visual = s.metadata = 1.0;
    s.fused = 1.0;
    return s;
  }

  s.fuzzy = FuzzySimilarity(a.fuzzy_hash, b.fuzzy_hash);
  if (a.tfidf_vector && b.tfidf_vector) {
    s.tfidf = TfidfVectorizer::Similarity(*a.tfidf_vector, *b.tfidf_vector);
  }
  s.semantic = SemanticSimilarity(a.semantic_vector, b.semantic_vector);
  s.structural = StructuralSimilarity(a.structural_features, b.structural_features);
  s.visual = VisualSimilarity(a.visual_hash, b.visual_hash);
  s.metadata = MetadataSimilarity(a.metadata_hash, b.metadata_hash);
  s.fused = Fuse(s);
  return s;
}

DuplicateType Comparator::Classify(const SimilarityBreakdown& s) {
  using T = ClassificationThresholds;
  if (s.hash_match || s.fused >= T::kExact) return DuplicateType::kExact;
  if (s.fused >= T::kNearExact) return DuplicateType::kNearExact;
  if (s.structural >= T::kVersionStructural && s.tfidf >= T::kVersionTfidf) {
    return DuplicateType::kVersion;
  }
  if (s.structural >= T::kTemplateStructural && s.tfidf < T::kTemplateTfidf) {
    return DuplicateType::kTemplate;
  }
  if (s.fused >= T::kSimilar) return DuplicateType::kSimilar;
  if (s.fused >= T::kPartial) return DuplicateType::kPartial;
  return DuplicateType::kNotDuplicate;
}

double Comparator::Confidence(const SimilarityBreakdown& s) {
  double values[4];
  size_t n = 0;
  for (double v : {s.fuzzy, s.tfidf, s.semantic, s.structural}) {
    if (v > 0.0) values[n++] = v;
  }
  if (n < 2) return 0.5;

  double mean = 0.0;
  for (size_t i = 0; i < n; ++i) mean += values[i];
  mean /= static_cast<double>(n);

  double variance = 0.0;
  for (size_t i = 0; i < n; ++i) variance += (values[i] - mean) * (values[i] - mean);
  variance /= static_cast<double>(n);

  double confidence = std::max(0.1, 1.0 - 2.0 * std::sqrt(variance));
  if (mean >= 0.8) confidence = std::min(1.0, confidence + 0.2);
  return confidence;
}

SimilarityMethod Comparator::PrimaryMethod(const SimilarityBreakdown& s) {
  SimilarityMethod best = SimilarityMethod::kFuzzy;
  double best_score = s.fuzzy;
  if (s.tfidf > best_score) {
    best = SimilarityMethod::kTfidf;
    best_score = s.tfidf;
  }
  if (s.semantic > best_score) {
    best = SimilarityMethod::kSemantic;
    best_score = s.semantic;
  }
  if (s.structural > best_score) best = SimilarityMethod::kStructural;
  return best;
}

std::optional<DuplicateMatch> Comparator::FromBreakdown(const DocumentFingerprint& a,
                                                        const DocumentFingerprint& b,
                                                        const SimilarityBreakdown& scores,
                                                        uint64_t timestamp_us) {
  if (!scores.hash_match && scores.fused < ClassificationThresholds::kReportingFloor) {
    return std::nullopt;
  }

  const bool swap = b.document_id < a.document_id;
  const DocumentFingerprint& first = swap ? b : a;
  const DocumentFingerprint& second = swap ? a : b;

  DuplicateMatch m;
  m.document_id_1 = first.document_id;
  m.document_id_2 = second.document_id;
  m.similarity_score = scores.fused;
  m.details.scores = scores;
  m.details.word_count_diff = AbsDiff(a.word_count, b.word_count);
  m.details.page_count_diff = AbsDiff(a.page_count, b.page_count);
  m.timestamp_us = timestamp_us;

  if (scores.hash_match) {
    m.duplicate_type = DuplicateType::kExact;
    m.similarity_score = 1.0;
    m.confidence = 1.0;
    m.method_used = SimilarityMethod::kHash;
    return m;
  }

  m.duplicate_type = Classify(scores);
  m.confidence = Confidence(scores);
  m.method_used = PrimaryMethod(scores);
  return m;
}

std::optional<DuplicateMatch> Comparator::Compare(const DocumentFingerprint& a,
                                                  const DocumentFingerprint& b,
                                                  uint64_t timestamp_us) {
  return FromBreakdown(a, b, Score(a, b), timestamp_us);
}

std::optional<DuplicateMatch> Comparator::Compare(const DocumentFingerprint& a,
                                                  const DocumentFingerprint& b) {
  return Compare(a, b, internal::WallClockMicros());
}

}  // namespace verity
