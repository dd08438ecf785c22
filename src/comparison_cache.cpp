#include <verity/comparison_cache.hpp>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <utility>

namespace verity {

ComparisonCache::ComparisonCache(size_t shard_count) {
  shard_count = std::max<size_t>(1, shard_count);
  pair_shards_.reserve(shard_count);
  partner_shards_.reserve(shard_count);
  for (size_t i = 0; i < shard_count; ++i) {
    pair_shards_.push_back(std::make_unique<PairShard>());
    partner_shards_.push_back(std::make_unique<PartnerShard>());
  }
}

// Ids may contain any byte except NUL.
std::string ComparisonCache::PairKey(std::string_view lo, std::string_view hi) {
  std::string key;
  key.reserve(lo.size() + hi.size() + 1);
  key.append(lo.data(), lo.size());
  key.push_back('\0');
  key.append(hi.data(), hi.size());
  return key;
}

ComparisonCache::PairShard& ComparisonCache::PairShardFor(const std::string& key) const {
  return *pair_shards_[std::hash<std::string>{}(key) % pair_shards_.size()];
}

ComparisonCache::PartnerShard& ComparisonCache::PartnerShardFor(std::string_view id) const {
  return *partner_shards_[std::hash<std::string_view>{}(id) % partner_shards_.size()];
}

ComparisonCache::LookupResult ComparisonCache::Lookup(const DocumentFingerprint& a,
                                                      const DocumentFingerprint& b,
                                                      double* score) {
  const bool swap = b.document_id < a.document_id;
  const DocumentFingerprint& lo = swap ? b : a;
  const DocumentFingerprint& hi = swap ? a : b;
  const std::string key = PairKey(lo.document_id, hi.document_id);
  PairShard& shard = PairShardFor(key);

  {
    std::shared_lock<std::shared_mutex> lock(shard.mu);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) return LookupResult::kMiss;
    if (it->second.revision_1 == lo.revision && it->second.revision_2 == hi.revision) {
      if (score) *score = it->second.score;
      return LookupResult::kHit;
    }
  }

  // Stale: drop the entry only if it predates one of the caller's
  // fingerprints. A caller holding an older snapshot leaves newer scores alone.
  std::unique_lock<std::shared_mutex> lock(shard.mu);
  auto it = shard.entries.find(key);
  if (it != shard.entries.end() &&
      (it->second.revision_1 < lo.revision || it->second.revision_2 < hi.revision)) {
    shard.entries.erase(it);
  }
  return LookupResult::kStale;
}

void ComparisonCache::Store(const DocumentFingerprint& a, const DocumentFingerprint& b,
                            double score) {
  const bool swap = b.document_id < a.document_id;
  const DocumentFingerprint& lo = swap ? b : a;
  const DocumentFingerprint& hi = swap ? a : b;
  const std::string key = PairKey(lo.document_id, hi.document_id);

  {
    PairShard& shard = PairShardFor(key);
    std::unique_lock<std::shared_mutex> lock(shard.mu);
    shard.entries[key] = Entry{score, lo.revision, hi.revision};
  }

  // Locks are taken one at a time, never nested.
  for (const auto& [id, partner] : {std::make_pair(&lo.document_id, &hi.document_id),
                                    std::make_pair(&hi.document_id, &lo.document_id)}) {
    PartnerShard& ps = PartnerShardFor(*id);
    std::unique_lock<std::shared_mutex> lock(ps.mu);
    ps.partners[*id].insert(*partner);
  }
}

bool ComparisonCache::ErasePair(std::string_view lo, std::string_view hi) {
  const std::string key = PairKey(lo, hi);
  PairShard& shard = PairShardFor(key);
  std::unique_lock<std::shared_mutex> lock(shard.mu);
  return shard.entries.erase(key) > 0;
}

void ComparisonCache::UnlinkPartner(std::string_view id, std::string_view partner) {
  PartnerShard& ps = PartnerShardFor(id);
  std::unique_lock<std::shared_mutex> lock(ps.mu);
  auto it = ps.partners.find(std::string(id));
  if (it == ps.partners.end()) return;
  it->second.erase(std::string(partner));
  if (it->second.empty()) ps.partners.erase(it);
}

size_t ComparisonCache::Invalidate(std::string_view document_id) {
  std::unordered_set<std::string> partners;
  {
    PartnerShard& ps = PartnerShardFor(document_id);
    std::unique_lock<std::shared_mutex> lock(ps.mu);
    auto it = ps.partners.find(std::string(document_id));
    if (it == ps.partners.end()) return 0;
    partners = std::move(it->second);
    ps.partners.erase(it);
  }

  size_t evicted = 0;
  for (const std::string& partner : partners) {
    const bool id_first = document_id < std::string_view(partner);
    if (ErasePair(id_first ? document_id : std::string_view(partner),
                  id_first ? std::string_view(partner) : document_id)) {
      ++evicted;
    }
    UnlinkPartner(partner, document_id);
  }
  return evicted;
}

void ComparisonCache::Clear() {
  for (auto& shard : pair_shards_) {
    std::unique_lock<std::shared_mutex> lock(shard->mu);
    shard->entries.clear();
  }
  for (auto& shard : partner_shards_) {
    std::unique_lock<std::shared_mutex> lock(shard->mu);
    shard->partners.clear();
  }
}

size_t ComparisonCache::Size() const {
  size_t total = 0;
  for (const auto& shard : pair_shards_) {
    std::shared_lock<std::shared_mutex> lock(shard->mu);
    total += shard->entries.size();
  }
  return total;
}

}  // namespace verity
