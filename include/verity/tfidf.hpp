#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <rocksdb/status.h>

#include <verity/types.hpp>

namespace verity {

struct TfidfOptions {
  // Keep at most this many terms, by corpus frequency (0 = unlimited).
  size_t max_features = 10000;

  // Word n-gram range.
  int ngram_min = 1;
  int ngram_max = 3;

  // Drop English stop words before building n-grams.
  bool english_stop_words = true;
};

/**
 * Corpus-fitted TF-IDF vectorizer.
 *
 * Tokens are runs of two or more word characters, lower-cased. Terms are
 * word n-grams over the tokens that survive stop word removal. Weights are
 * raw term counts times the smoothed idf ln((1 + n) / (1 + df)) + 1, and every
 * vector is L2-normalised.
 *
 * Each successful Fit() replaces the vocabulary and assigns a new vocabulary
 * id. Transform() tags its output with the id so vectors produced from
 * different vocabularies are never compared.
 *
 * Thread-safe: Transform() runs under a shared lock, Fit() under an
 * exclusive one.
 */
class TfidfVectorizer {
 public:
  explicit TfidfVectorizer(TfidfOptions opt = TfidfOptions{});

  TfidfVectorizer(const TfidfVectorizer&) = delete;
  TfidfVectorizer& operator=(const TfidfVectorizer&) = delete;

  /** Fit on a corpus. InvalidArgument if the corpus yields no terms. */
  rocksdb::Status Fit(const std::vector<std::string>& documents);

  /**
   * Fit on `document` only if no vocabulary exists yet. Returns OK without
   * refitting when another caller won the race.
   */
  rocksdb::Status FitIfEmpty(std::string_view document);

  /** Vectorize text. nullopt when unfitted or when no term is in vocabulary. */
  std::optional<SparseVector> Transform(std::string_view text) const;

  bool IsFitted() const;
  uint64_t VocabularyId() const;
  size_t VocabularySize() const;

  /** Vocabulary ids handed out by later fits will be greater than `id`. */
  void ReserveVocabularyIds(uint64_t id);

  /** Persisted form of the fitted vocabulary (terms, idf, id). */
  std::string EncodeVocabulary() const;
  rocksdb::Status DecodeVocabulary(std::string_view bytes);

  /** Tokenize and build n-gram terms (exposed for tests). */
  std::vector<std::string> Analyze(std::string_view text) const;

  /** Cosine of two vectors; 0.0 when vocabularies differ or either is empty. */
  static double Similarity(const SparseVector& a, const SparseVector& b);

 private:
  rocksdb::Status FitLocked(const std::vector<std::string_view>& documents);

  const TfidfOptions opt_;

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, uint32_t> vocabulary_;
  std::vector<double> idf_;
  uint64_t vocabulary_id_ = 0;       // 0 = unfitted
  uint64_t next_vocabulary_id_ = 1;
};

}  // namespace verity
