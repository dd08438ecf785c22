#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace verity {

// Approximate neighbour of a query vector.
struct Neighbor {
  std::string document_id;
  float similarity;  // cosine, for unit vectors
};

/**
 * Blocking stage for batch detection: proposes, for each document, the
 * documents whose semantic vectors are nearest to it. Only proposed pairs
 * reach the Comparator when the detector runs with use_candidate_index.
 */
class CandidateIndex {
 public:
  virtual ~CandidateIndex() = default;

  // Insert or replace the vector of document_id. False on dimension mismatch.
  virtual bool Upsert(const std::string& document_id, const std::vector<float>& vector) = 0;

  // False when document_id is not indexed.
  virtual bool Remove(const std::string& document_id) = 0;

  // Up to k live neighbours, most similar first.
  virtual std::vector<Neighbor> Search(const std::vector<float>& query, int k) const = 0;

  virtual size_t Size() const = 0;
  virtual size_t Dimension() const = 0;

  // Vector slots allocated, live or deleted. Deleted slots are reused first.
  virtual size_t Capacity() const = 0;
};

// HNSW index (hnswlib). Returns nullptr when built without
// VERITY_ENABLE_SEMANTIC.
// - dimension: embedding dimension (e.g., 384)
// - initial_capacity: grows by doubling once no deleted slot is free
// - m: max connections per node
// - ef_construction / ef_search: build and query search depth
std::unique_ptr<CandidateIndex> CreateHnswCandidateIndex(size_t dimension,
                                                         size_t initial_capacity = 1024,
                                                         int m = 16,
                                                         int ef_construction = 200,
                                                         int ef_search = 50);

}  // namespace verity
