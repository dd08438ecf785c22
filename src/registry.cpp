#include <verity/registry.hpp>

#include <algorithm>
#include <functional>
#include <mutex>

namespace verity {

FingerprintRegistry::FingerprintRegistry(size_t shard_count) {
  shard_count = std::max<size_t>(1, shard_count);
  shards_.reserve(shard_count);
  for (size_t i = 0; i < shard_count; ++i) shards_.push_back(std::make_unique<Shard>());
}

FingerprintRegistry::Shard& FingerprintRegistry::ShardFor(std::string_view document_id) const {
  return *shards_[std::hash<std::string_view>{}(document_id) % shards_.size()];
}

FingerprintPtr FingerprintRegistry::Get(std::string_view document_id) const {
  Shard& shard = ShardFor(document_id);
  std::shared_lock<std::shared_mutex> lock(shard.mu);
  auto it = shard.map.find(std::string(document_id));
  return it == shard.map.end() ? nullptr : it->second;
}

FingerprintPtr FingerprintRegistry::Put(FingerprintPtr fingerprint) {
  if (!fingerprint) return nullptr;
  Shard& shard = ShardFor(fingerprint->document_id);
  std::unique_lock<std::shared_mutex> lock(shard.mu);
  FingerprintPtr& slot = shard.map[fingerprint->document_id];
  FingerprintPtr previous = std::move(slot);
  slot = std::move(fingerprint);
  return previous;
}

FingerprintPtr FingerprintRegistry::Remove(std::string_view document_id) {
  Shard& shard = ShardFor(document_id);
  std::unique_lock<std::shared_mutex> lock(shard.mu);
  auto it = shard.map.find(std::string(document_id));
  if (it == shard.map.end()) return nullptr;
  FingerprintPtr removed = std::move(it->second);
  shard.map.erase(it);
  return removed;
}

std::vector<FingerprintPtr> FingerprintRegistry::Snapshot() const {
  std::vector<FingerprintPtr> out;
  for (const auto& shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard->mu);
    for (const auto& kv : shard->map) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const FingerprintPtr& a, const FingerprintPtr& b) {
    return a->document_id < b->document_id;
  });
  return out;
}

size_t FingerprintRegistry::Size() const {
  size_t total = 0;
  for (const auto& shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard->mu);
    total += shard->map.size();
  }
  return total;
}

}  // namespace verity
