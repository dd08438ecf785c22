#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <verity/types.hpp>

namespace verity {

/**
 * Symmetric memo of fused pairwise scores.
 *
 * Entries are keyed by the canonical (smaller id, larger id) pair and record
 * the revisions of both fingerprints they were computed from. A lookup whose
 * revisions no longer match the caller's fingerprints is reported as stale,
 * so a score can never outlive a re-fingerprint even if an invalidation raced
 * with a concurrent store. Revisions only grow: the entry is dropped when it
 * predates the caller's fingerprints and kept when the caller's are older.
 *
 * Storage is split into shards, each behind its own reader/writer lock. A
 * per-id partner index makes Invalidate(id) proportional to the number of
 * entries touching `id`.
 */
class ComparisonCache {
 public:
  enum class LookupResult { kMiss, kHit, kStale };

  explicit ComparisonCache(size_t shard_count = 16);

  ComparisonCache(const ComparisonCache&) = delete;
  ComparisonCache& operator=(const ComparisonCache&) = delete;

  /** Look up the pair (order irrelevant). On kHit, *score is set. */
  LookupResult Lookup(const DocumentFingerprint& a, const DocumentFingerprint& b,
                      double* score);

  /** Record the fused score computed from these exact fingerprints. */
  void Store(const DocumentFingerprint& a, const DocumentFingerprint& b, double score);

  /** Evict every entry containing `document_id`. Returns the number evicted. */
  size_t Invalidate(std::string_view document_id);

  void Clear();
  size_t Size() const;

 private:
  struct Entry {
    double score = 0.0;
    uint64_t revision_1 = 0;  // of the smaller id
    uint64_t revision_2 = 0;
  };

  struct PairShard {
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, Entry> entries;
  };

  struct PartnerShard {
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, std::unordered_set<std::string>> partners;
  };

  static std::string PairKey(std::string_view lo, std::string_view hi);
  PairShard& PairShardFor(const std::string& key) const;
  PartnerShard& PartnerShardFor(std::string_view id) const;
  bool ErasePair(std::string_view lo, std::string_view hi);
  void UnlinkPartner(std::string_view id, std::string_view partner);

  std::vector<std::unique_ptr<PairShard>> pair_shards_;
  std::vector<std::unique_ptr<PartnerShard>> partner_shards_;
};

}  // namespace verity
