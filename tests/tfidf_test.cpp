// Unit tests for verity/tfidf.hpp
// Tests: analysis, fitting, transform, vocabulary ids, persistence format

#include <gtest/gtest.h>

#include <verity/tfidf.hpp>

#include <atomic>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

namespace verity {
namespace {

double Norm(const SparseVector& v) {
  double sum = 0.0;
  for (float x : v.values) sum += static_cast<double>(x) * x;
  return std::sqrt(sum);
}

// =============================================================================
// Analysis Tests
// =============================================================================

class TfidfAnalyzeTest : public ::testing::Test {};

TEST_F(TfidfAnalyzeTest, UnigramsDropStopWordsAndShortTokens) {
  TfidfOptions opt;
  opt.ngram_max = 1;
  TfidfVectorizer v(opt);
  EXPECT_EQ(v.Analyze("The Buyer shall pay a fee of 5 dollars"),
            (std::vector<std::string>{"buyer", "shall", "pay", "fee", "dollars"}));
}

TEST_F(TfidfAnalyzeTest, NgramsSpanRemainingTokens) {
  TfidfOptions opt;
  opt.ngram_max = 3;
  TfidfVectorizer v(opt);
  EXPECT_EQ(v.Analyze("lease term renewal"),
            (std::vector<std::string>{"lease", "term", "renewal", "lease term", "term renewal",
                                      "lease term renewal"}));
}

TEST_F(TfidfAnalyzeTest, PunctuationSplitsTokens) {
  TfidfOptions opt;
  opt.ngram_max = 1;
  TfidfVectorizer v(opt);
  EXPECT_EQ(v.Analyze("non-disclosure"), (std::vector<std::string>{"non", "disclosure"}));
}

TEST_F(TfidfAnalyzeTest, StopWordsCanBeKept) {
  TfidfOptions opt;
  opt.ngram_max = 1;
  opt.english_stop_words = false;
  TfidfVectorizer v(opt);
  EXPECT_EQ(v.Analyze("of the lease"), (std::vector<std::string>{"of", "the", "lease"}));
}

TEST_F(TfidfAnalyzeTest, FullEnglishStopList) {
  TfidfOptions opt;
  opt.ngram_max = 1;
  TfidfVectorizer v(opt);
  EXPECT_EQ(v.Analyze("Find the system interest detail to keep the bill call found"),
            (std::vector<std::string>{}));
  EXPECT_EQ(v.Analyze("amount of rent"), (std::vector<std::string>{"rent"}));
}

TEST_F(TfidfAnalyzeTest, LowercasesBeyondAscii) {
  TfidfOptions opt;
  opt.ngram_max = 1;
  TfidfVectorizer v(opt);
  // "DÉCLARATION" and "déclaration" produce the same token
  EXPECT_EQ(v.Analyze("D\xC3\x89" "CLARATION"), v.Analyze("d\xC3\xA9" "claration"));
  EXPECT_EQ(v.Analyze("D\xC3\x89" "CLARATION"),
            (std::vector<std::string>{"d\xC3\xA9" "claration"}));
}

// =============================================================================
// Fit / Transform Tests
// =============================================================================

class TfidfFitTest : public ::testing::Test {
 protected:
  std::vector<std::string> corpus_ = {
      "The tenant shall pay rent monthly to the landlord.",
      "The landlord shall maintain the premises in good repair.",
      "Either party may terminate the lease with written notice.",
  };
};

TEST_F(TfidfFitTest, UnfittedTransformIsAbsent) {
  TfidfVectorizer v;
  EXPECT_FALSE(v.IsFitted());
  EXPECT_EQ(v.VocabularyId(), 0u);
  EXPECT_FALSE(v.Transform("tenant pays rent").has_value());
}

TEST_F(TfidfFitTest, FitAssignsIncreasingIds) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());
  const uint64_t first = v.VocabularyId();
  EXPECT_GT(first, 0u);
  EXPECT_GT(v.VocabularySize(), 0u);
  ASSERT_TRUE(v.Fit(corpus_).ok());
  EXPECT_GT(v.VocabularyId(), first);
}

TEST_F(TfidfFitTest, EmptyCorpusRejected) {
  TfidfVectorizer v;
  EXPECT_TRUE(v.Fit({}).IsInvalidArgument());
  EXPECT_TRUE(v.Fit({"the of and a"}).IsInvalidArgument());
  EXPECT_FALSE(v.IsFitted());
}

TEST_F(TfidfFitTest, FitIfEmptyOnlyFitsOnce) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.FitIfEmpty("tenant rent landlord").ok());
  const uint64_t id = v.VocabularyId();
  ASSERT_TRUE(v.FitIfEmpty("completely different words here").ok());
  EXPECT_EQ(v.VocabularyId(), id);
}

TEST_F(TfidfFitTest, TransformIsUnitLengthAndSorted) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());
  auto vec = v.Transform(corpus_[0]);
  ASSERT_TRUE(vec.has_value());
  EXPECT_EQ(vec->vocabulary_id, v.VocabularyId());
  EXPECT_NEAR(Norm(*vec), 1.0, 1e-6);
  for (size_t i = 1; i < vec->indices.size(); ++i) {
    EXPECT_LT(vec->indices[i - 1], vec->indices[i]);
  }
}

TEST_F(TfidfFitTest, OutOfVocabularyTextIsAbsent) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());
  EXPECT_FALSE(v.Transform("zebra quantum xylophone").has_value());
}

TEST_F(TfidfFitTest, MaxFeaturesKeepsMostFrequentTerms) {
  TfidfOptions opt;
  opt.max_features = 2;
  opt.ngram_max = 1;
  TfidfVectorizer v(opt);
  ASSERT_TRUE(v.Fit({"lease lease lease rent rent notice", "lease rent"}).ok());
  EXPECT_EQ(v.VocabularySize(), 2u);
  EXPECT_FALSE(v.Transform("notice").has_value());
  EXPECT_TRUE(v.Transform("lease").has_value());
}

TEST_F(TfidfFitTest, SmoothedIdfWeighsRareTermsHigher) {
  TfidfOptions opt;
  opt.ngram_max = 1;
  TfidfVectorizer v(opt);
  // "lease" in both documents, "arbitration" in one
  ASSERT_TRUE(v.Fit({"lease arbitration", "lease"}).ok());
  auto vec = v.Transform("lease arbitration");
  ASSERT_TRUE(vec.has_value());
  ASSERT_EQ(vec->indices.size(), 2u);
  // Indices follow term order: arbitration (0), lease (1)
  const double idf_rare = std::log(3.0 / 2.0) + 1.0;
  const double idf_common = 1.0;
  const double norm = std::sqrt(idf_rare * idf_rare + idf_common * idf_common);
  EXPECT_NEAR(vec->values[0], idf_rare / norm, 1e-6);
  EXPECT_NEAR(vec->values[1], idf_common / norm, 1e-6);
}

// =============================================================================
// Similarity Tests
// =============================================================================

class TfidfSimilarityTest : public TfidfFitTest {};

TEST_F(TfidfSimilarityTest, IdenticalTextScoresOne) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());
  auto a = v.Transform(corpus_[1]);
  ASSERT_TRUE(a.has_value());
  EXPECT_NEAR(TfidfVectorizer::Similarity(*a, *a), 1.0, 1e-6);
}

TEST_F(TfidfSimilarityTest, RelatedBeatsUnrelated) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());
  auto base = v.Transform("The tenant shall pay rent monthly to the landlord.");
  auto near = v.Transform("The tenant shall pay rent weekly to the landlord.");
  auto far = v.Transform("Either party may terminate the lease with written notice.");
  ASSERT_TRUE(base && near && far);
  EXPECT_GT(TfidfVectorizer::Similarity(*base, *near), TfidfVectorizer::Similarity(*base, *far));
}

TEST_F(TfidfSimilarityTest, DifferentVocabulariesNeverCompare) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());
  auto before = v.Transform(corpus_[0]);
  ASSERT_TRUE(v.Fit(corpus_).ok());
  auto after = v.Transform(corpus_[0]);
  ASSERT_TRUE(before && after);
  EXPECT_EQ(TfidfVectorizer::Similarity(*before, *after), 0.0);
}

TEST_F(TfidfSimilarityTest, EmptyVectorScoresZero) {
  SparseVector empty;
  SparseVector one;
  one.indices = {0};
  one.values = {1.0f};
  EXPECT_EQ(TfidfVectorizer::Similarity(empty, one), 0.0);
}

// =============================================================================
// Persistence Tests
// =============================================================================

class TfidfPersistenceTest : public TfidfFitTest {};

TEST_F(TfidfPersistenceTest, DecodedVocabularyTransformsIdentically) {
  TfidfVectorizer original;
  ASSERT_TRUE(original.Fit(corpus_).ok());

  TfidfVectorizer restored;
  ASSERT_TRUE(restored.DecodeVocabulary(original.EncodeVocabulary()).ok());
  EXPECT_EQ(restored.VocabularyId(), original.VocabularyId());
  EXPECT_EQ(restored.VocabularySize(), original.VocabularySize());

  auto a = original.Transform(corpus_[2]);
  auto b = restored.Transform(corpus_[2]);
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->indices, b->indices);
  EXPECT_EQ(a->values, b->values);
  EXPECT_NEAR(TfidfVectorizer::Similarity(*a, *b), 1.0, 1e-6);
}

TEST_F(TfidfPersistenceTest, RefitAfterDecodeGetsFreshId) {
  TfidfVectorizer original;
  ASSERT_TRUE(original.Fit(corpus_).ok());
  ASSERT_TRUE(original.Fit(corpus_).ok());

  TfidfVectorizer restored;
  ASSERT_TRUE(restored.DecodeVocabulary(original.EncodeVocabulary()).ok());
  ASSERT_TRUE(restored.Fit(corpus_).ok());
  EXPECT_GT(restored.VocabularyId(), original.VocabularyId());
}

TEST_F(TfidfPersistenceTest, ReserveVocabularyIds) {
  TfidfVectorizer v;
  v.ReserveVocabularyIds(41);
  ASSERT_TRUE(v.Fit(corpus_).ok());
  EXPECT_EQ(v.VocabularyId(), 42u);
}

TEST_F(TfidfPersistenceTest, CorruptInputRejected) {
  TfidfVectorizer original;
  ASSERT_TRUE(original.Fit(corpus_).ok());
  std::string bytes = original.EncodeVocabulary();

  TfidfVectorizer v;
  EXPECT_TRUE(v.DecodeVocabulary("").IsCorruption());
  EXPECT_TRUE(v.DecodeVocabulary(bytes.substr(0, bytes.size() - 3)).IsCorruption());
  EXPECT_TRUE(v.DecodeVocabulary(bytes + "x").IsCorruption());
  EXPECT_FALSE(v.IsFitted());
}

// =============================================================================
// Concurrency Tests
// =============================================================================

TEST_F(TfidfFitTest, TransformDuringRefit) {
  TfidfVectorizer v;
  ASSERT_TRUE(v.Fit(corpus_).ok());

  std::atomic<bool> stop{false};
  std::atomic<uint64_t> absent{0};
  std::thread reader([&] {
    while (!stop.load()) {
      if (!v.Transform(corpus_[0]).has_value()) absent.fetch_add(1);
    }
  });
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(v.Fit(corpus_).ok());
  }
  stop.store(true);
  reader.join();
  EXPECT_EQ(absent.load(), 0u);
}

}  // namespace
}  // namespace verity
