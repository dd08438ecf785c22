#pragma once

#include <functional>
#include <string>
#include <vector>

#include <rocksdb/status.h>

#include <verity/types.hpp>

namespace verity {

/** True for the duplicate types that link documents into one cluster. */
bool IsClusteringType(DuplicateType type);

/**
 * Connected components over the matches whose type clusters (EXACT,
 * NEAR_EXACT, VERSION, SIMILAR). Singletons are dropped, ids within a
 * cluster are sorted, clusters come largest first with ties broken by their
 * first id.
 */
std::vector<Cluster> BuildClusters(const std::vector<DuplicateMatch>& matches);

using FingerprintLookup = std::function<FingerprintPtr(const std::string&)>;

/**
 * Pick one keeper per cluster.
 *
 * kNewest/kOldest compare created_at, kLongest/kShortest word_count; ties go
 * to the smallest id. NotFound if a member has no fingerprint.
 */
rocksdb::Status ResolveClusters(const std::vector<Cluster>& clusters,
                                const FingerprintLookup& lookup,
                                KeepStrategy strategy,
                                std::vector<DedupDecision>* out);

/** `ids` minus every dropped id, sorted and unique. */
std::vector<std::string> KeepList(const std::vector<std::string>& ids,
                                  const std::vector<DedupDecision>& decisions);

}  // namespace verity
