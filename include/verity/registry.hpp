#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <verity/types.hpp>

namespace verity {

/**
 * Concurrent document_id -> fingerprint map.
 *
 * Fingerprints are immutable and shared, so readers keep using a pointer
 * they obtained even after the id is overwritten or removed.
 */
class FingerprintRegistry {
 public:
  explicit FingerprintRegistry(size_t shard_count = 16);

  FingerprintRegistry(const FingerprintRegistry&) = delete;
  FingerprintRegistry& operator=(const FingerprintRegistry&) = delete;

  /** nullptr when absent. */
  FingerprintPtr Get(std::string_view document_id) const;

  /** Insert or replace. Returns the previous fingerprint, if any. */
  FingerprintPtr Put(FingerprintPtr fingerprint);

  /** Returns the removed fingerprint, or nullptr when absent. */
  FingerprintPtr Remove(std::string_view document_id);

  /** Point-in-time copy of every fingerprint, sorted by id. */
  std::vector<FingerprintPtr> Snapshot() const;

  size_t Size() const;

 private:
  struct Shard {
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, FingerprintPtr> map;
  };

  Shard& ShardFor(std::string_view document_id) const;

  std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace verity
