#include <verity/clusters.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <unordered_set>

namespace verity {

bool IsClusteringType(DuplicateType type) {
  switch (type) {
    case DuplicateType::kExact:
    case DuplicateType::kNearExact:
    case DuplicateType::kVersion:
    case DuplicateType::kSimilar:
      return true;
    default:
      return false;
  }
}

std::vector<Cluster> BuildClusters(const std::vector<DuplicateMatch>& matches) {
  std::map<std::string, std::vector<std::string>> graph;
  for (const DuplicateMatch& m : matches) {
    if (!IsClusteringType(m.duplicate_type)) continue;
    graph[m.document_id_1].push_back(m.document_id_2);
    graph[m.document_id_2].push_back(m.document_id_1);
  }

  std::vector<Cluster> clusters;
  std::unordered_set<std::string> visited;
  for (const auto& entry : graph) {
    if (visited.count(entry.first)) continue;

    Cluster cluster;
    std::vector<const std::string*> stack{&entry.first};
    visited.insert(entry.first);
    while (!stack.empty()) {
      const std::string* node = stack.back();
      stack.pop_back();
      cluster.push_back(*node);
      for (const std::string& next : graph[*node]) {
        if (visited.insert(next).second) stack.push_back(&next);
      }
    }

    if (cluster.size() < 2) continue;
    std::sort(cluster.begin(), cluster.end());
    clusters.push_back(std::move(cluster));
  }

  std::sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
    if (a.size() != b.size()) return a.size() > b.size();
    return a.front() < b.front();
  });
  return clusters;
}

namespace {

// True when `candidate` should replace `best` as keeper. Members are visited
// in id order, so a tie keeps the earlier (smaller) id.
bool Beats(const DocumentFingerprint& candidate, const DocumentFingerprint& best,
           KeepStrategy strategy) {
  switch (strategy) {
    case KeepStrategy::kNewest:
      return candidate.created_at_us > best.created_at_us;
    case KeepStrategy::kOldest:
      return candidate.created_at_us < best.created_at_us;
    case KeepStrategy::kLongest:
      return candidate.word_count > best.word_count;
    case KeepStrategy::kShortest:
      return candidate.word_count < best.word_count;
  }
  return false;
}

}  // namespace

rocksdb::Status ResolveClusters(const std::vector<Cluster>& clusters,
                                const FingerprintLookup& lookup,
                                KeepStrategy strategy,
                                std::vector<DedupDecision>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!lookup) return rocksdb::Status::InvalidArgument("lookup is empty");

  std::vector<DedupDecision> decisions;
  decisions.reserve(clusters.size());
  for (const Cluster& cluster : clusters) {
    if (cluster.empty()) continue;

    std::vector<std::string> members(cluster.begin(), cluster.end());
    std::sort(members.begin(), members.end());

    FingerprintPtr best;
    for (const std::string& id : members) {
      FingerprintPtr fp = lookup(id);
      if (!fp) return rocksdb::Status::NotFound("no fingerprint for " + id);
      if (!best || Beats(*fp, *best, strategy)) best = std::move(fp);
    }

    DedupDecision decision;
    decision.keeper = best->document_id;
    for (std::string& id : members) {
      if (id != decision.keeper) decision.dropped.push_back(std::move(id));
    }
    decisions.push_back(std::move(decision));
  }

  *out = std::move(decisions);
  return rocksdb::Status::OK();
}

std::vector<std::string> KeepList(const std::vector<std::string>& ids,
                                  const std::vector<DedupDecision>& decisions) {
  std::unordered_set<std::string> dropped;
  for (const DedupDecision& d : decisions) dropped.insert(d.dropped.begin(), d.dropped.end());

  std::set<std::string> keep;
  for (const std::string& id : ids) {
    if (!dropped.count(id)) keep.insert(id);
  }
  return std::vector<std::string>(keep.begin(), keep.end());
}

}  // namespace verity
