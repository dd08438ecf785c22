// Unit tests for verity/comparison_cache.hpp
// Tests: symmetric lookup, revision staleness, invalidation, concurrency

#include <gtest/gtest.h>

#include <verity/comparison_cache.hpp>
#include <verity/test_utils.hpp>

#include <string>
#include <thread>
#include <vector>

namespace verity {
namespace {

using verity::testing::MakeFingerprint;

// =============================================================================
// Test Fixture
// =============================================================================

class ComparisonCacheTest : public ::testing::Test {
 protected:
  void SetUp() override {
    a_ = MakeFingerprint("a", "hash-a");
    b_ = MakeFingerprint("b", "hash-b");
    c_ = MakeFingerprint("c", "hash-c");
  }

  std::shared_ptr<DocumentFingerprint> Rebuilt(const DocumentFingerprint& fp) {
    auto copy = std::make_shared<DocumentFingerprint>(fp);
    copy->revision = FingerprintBuilder::NextRevision();
    return copy;
  }

  ComparisonCache cache_{4};
  std::shared_ptr<DocumentFingerprint> a_, b_, c_;
};

// =============================================================================
// Lookup Tests
// =============================================================================

TEST_F(ComparisonCacheTest, MissOnEmpty) {
  double score = -1;
  EXPECT_EQ(cache_.Lookup(*a_, *b_, &score), ComparisonCache::LookupResult::kMiss);
  EXPECT_EQ(score, -1);
  EXPECT_EQ(cache_.Size(), 0u);
}

TEST_F(ComparisonCacheTest, HitIsSymmetric) {
  cache_.Store(*b_, *a_, 0.75);
  double score = 0;
  EXPECT_EQ(cache_.Lookup(*a_, *b_, &score), ComparisonCache::LookupResult::kHit);
  EXPECT_DOUBLE_EQ(score, 0.75);
  EXPECT_EQ(cache_.Lookup(*b_, *a_, &score), ComparisonCache::LookupResult::kHit);
  EXPECT_EQ(cache_.Size(), 1u);
}

TEST_F(ComparisonCacheTest, StoreOverwrites) {
  cache_.Store(*a_, *b_, 0.5);
  cache_.Store(*a_, *b_, 0.9);
  double score = 0;
  ASSERT_EQ(cache_.Lookup(*a_, *b_, &score), ComparisonCache::LookupResult::kHit);
  EXPECT_DOUBLE_EQ(score, 0.9);
  EXPECT_EQ(cache_.Size(), 1u);
}

TEST_F(ComparisonCacheTest, NullScoreAllowed) {
  cache_.Store(*a_, *b_, 0.5);
  EXPECT_EQ(cache_.Lookup(*a_, *b_, nullptr), ComparisonCache::LookupResult::kHit);
}

// =============================================================================
// Staleness Tests
// =============================================================================

TEST_F(ComparisonCacheTest, RebuiltFingerprintIsStale) {
  cache_.Store(*a_, *b_, 0.8);
  auto a2 = Rebuilt(*a_);

  double score = 0;
  EXPECT_EQ(cache_.Lookup(*a2, *b_, &score), ComparisonCache::LookupResult::kStale);
  // The stale entry is dropped
  EXPECT_EQ(cache_.Size(), 0u);
  EXPECT_EQ(cache_.Lookup(*a2, *b_, &score), ComparisonCache::LookupResult::kMiss);
}

TEST_F(ComparisonCacheTest, StaleOnEitherSide) {
  cache_.Store(*a_, *b_, 0.8);
  auto b2 = Rebuilt(*b_);
  EXPECT_EQ(cache_.Lookup(*b2, *a_, nullptr), ComparisonCache::LookupResult::kStale);
}

TEST_F(ComparisonCacheTest, FreshStoreAfterStale) {
  cache_.Store(*a_, *b_, 0.8);
  auto a2 = Rebuilt(*a_);
  cache_.Store(*a2, *b_, 0.4);

  double score = 0;
  EXPECT_EQ(cache_.Lookup(*a2, *b_, &score), ComparisonCache::LookupResult::kHit);
  EXPECT_DOUBLE_EQ(score, 0.4);
  // A caller still holding the old fingerprint sees a stale entry but does
  // not evict the newer score
  EXPECT_EQ(cache_.Lookup(*a_, *b_, nullptr), ComparisonCache::LookupResult::kStale);
  EXPECT_EQ(cache_.Size(), 1u);
  EXPECT_EQ(cache_.Lookup(*a2, *b_, &score), ComparisonCache::LookupResult::kHit);
}

// =============================================================================
// Invalidation Tests
// =============================================================================

TEST_F(ComparisonCacheTest, InvalidateEvictsEveryPairWithId) {
  cache_.Store(*a_, *b_, 0.1);
  cache_.Store(*a_, *c_, 0.2);
  cache_.Store(*b_, *c_, 0.3);

  EXPECT_EQ(cache_.Invalidate("a"), 2u);
  EXPECT_EQ(cache_.Size(), 1u);
  EXPECT_EQ(cache_.Lookup(*a_, *b_, nullptr), ComparisonCache::LookupResult::kMiss);
  EXPECT_EQ(cache_.Lookup(*a_, *c_, nullptr), ComparisonCache::LookupResult::kMiss);
  EXPECT_EQ(cache_.Lookup(*b_, *c_, nullptr), ComparisonCache::LookupResult::kHit);
}

TEST_F(ComparisonCacheTest, InvalidateUnknownId) {
  cache_.Store(*a_, *b_, 0.1);
  EXPECT_EQ(cache_.Invalidate("zzz"), 0u);
  EXPECT_EQ(cache_.Size(), 1u);
}

TEST_F(ComparisonCacheTest, InvalidateTwice) {
  cache_.Store(*a_, *b_, 0.1);
  EXPECT_EQ(cache_.Invalidate("b"), 1u);
  EXPECT_EQ(cache_.Invalidate("b"), 0u);
  // The partner link from "a" was removed too
  EXPECT_EQ(cache_.Invalidate("a"), 0u);
}

TEST_F(ComparisonCacheTest, IdsWithSharedPrefixesStayDistinct) {
  auto ab = MakeFingerprint("ab", "h1");
  auto x = MakeFingerprint("x", "h2");
  auto abx = MakeFingerprint("abx", "h3");
  cache_.Store(*ab, *x, 0.5);
  EXPECT_EQ(cache_.Lookup(*a_, *abx, nullptr), ComparisonCache::LookupResult::kMiss);
}

TEST_F(ComparisonCacheTest, Clear) {
  cache_.Store(*a_, *b_, 0.1);
  cache_.Store(*b_, *c_, 0.2);
  cache_.Clear();
  EXPECT_EQ(cache_.Size(), 0u);
  EXPECT_EQ(cache_.Invalidate("b"), 0u);
}

// =============================================================================
// Concurrency Tests
// =============================================================================

TEST_F(ComparisonCacheTest, ConcurrentStoreLookupInvalidate) {
  std::vector<std::shared_ptr<DocumentFingerprint>> fps;
  for (int i = 0; i < 32; ++i) {
    fps.push_back(MakeFingerprint("doc" + std::to_string(i), "h" + std::to_string(i)));
  }

  verity::testing::TestResultCollector results;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int round = 0; round < 200; ++round) {
        const auto& x = *fps[(round + t) % fps.size()];
        const auto& y = *fps[(round * 7 + t + 1) % fps.size()];
        if (x.document_id == y.document_id) continue;
        cache_.Store(x, y, 0.5);
        double score = 0;
        auto r = cache_.Lookup(x, y, &score);
        // A concurrent invalidation may have removed it; a hit must be exact
        CHECK_AND_RECORD(results, r != ComparisonCache::LookupResult::kHit || score == 0.5,
                         "hit returned a foreign score");
        if (round % 10 == 0) cache_.Invalidate(x.document_id);
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_TRUE(results.AllSucceeded());

  for (const auto& fp : fps) cache_.Invalidate(fp->document_id);
  EXPECT_EQ(cache_.Size(), 0u);
}

}  // namespace
}  // namespace verity
