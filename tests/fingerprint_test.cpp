// Unit tests for verity/fingerprint.hpp
// Tests: hashes, optional signals, collaborator failures and timeouts, counts

#include <gtest/gtest.h>

#include <verity/fingerprint.hpp>
#include <verity/test_utils.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace verity {
namespace {

using namespace std::chrono_literals;
using verity::testing::WordsText;

// =============================================================================
// Test Fixture
// =============================================================================

class FingerprintBuilderTest : public ::testing::Test {
 protected:
  std::shared_ptr<DocumentFingerprint> Build(const FingerprintBuilder::Config& config,
                                             const std::string& text,
                                             const Json::Value& metadata = Json::Value(),
                                             const std::string& image_ref = "",
                                             BuildReport* report = nullptr) {
    FingerprintBuilder builder(config, &vectorizer_);
    std::shared_ptr<DocumentFingerprint> fp;
    auto s = builder.Build("doc", text, metadata, image_ref, &fp, report);
    EXPECT_TRUE(s.ok()) << s.ToString();
    return fp;
  }

  TfidfVectorizer vectorizer_;
  const std::string lease_ =
      "LEASE AGREEMENT\n\nThe Landlord leases the premises to the Tenant.\n"
      "1. Rent. The Tenant shall pay rent monthly.\nSigned by both parties.";
};

// =============================================================================
// Argument Tests
// =============================================================================

TEST_F(FingerprintBuilderTest, EmptyIdRejected) {
  FingerprintBuilder builder(FingerprintBuilder::Config{}, &vectorizer_);
  std::shared_ptr<DocumentFingerprint> fp;
  EXPECT_TRUE(builder.Build("", lease_, Json::Value(), "", &fp).IsInvalidArgument());
  EXPECT_EQ(fp, nullptr);
}

TEST_F(FingerprintBuilderTest, NullOutputRejected) {
  FingerprintBuilder builder(FingerprintBuilder::Config{}, &vectorizer_);
  EXPECT_TRUE(builder.Build("doc", lease_, Json::Value(), "", nullptr).IsInvalidArgument());
}

TEST_F(FingerprintBuilderTest, EmptyTextIsAllowed) {
  BuildReport report;
  auto fp = Build(FingerprintBuilder::Config{}, "", Json::Value(), "", &report);
  ASSERT_NE(fp, nullptr);
  EXPECT_EQ(fp->word_count, 0u);
  EXPECT_EQ(fp->page_count, 1u);
  EXPECT_FALSE(fp->tfidf_vector.has_value());
  EXPECT_TRUE(report.tfidf_absent);
}

// =============================================================================
// Hash Tests
// =============================================================================

TEST_F(FingerprintBuilderTest, ContentHashIgnoresWhitespaceAndCase) {
  const auto mode = NormalizationMode::kASCII;
  EXPECT_EQ(FingerprintBuilder::ContentHash("The  Agreement\n", mode),
            FingerprintBuilder::ContentHash("the agreement", mode));
  EXPECT_NE(FingerprintBuilder::ContentHash("the agreement", mode),
            FingerprintBuilder::ContentHash("the agreements", mode));
}

TEST_F(FingerprintBuilderTest, WhitespaceModeKeepsCase) {
  const auto mode = NormalizationMode::kWhitespace;
  EXPECT_NE(FingerprintBuilder::ContentHash("The Agreement", mode),
            FingerprintBuilder::ContentHash("the agreement", mode));
}

TEST_F(FingerprintBuilderTest, ContentHashIsMd5OfNormalizedText) {
  EXPECT_EQ(FingerprintBuilder::ContentHash("  HELLO ", NormalizationMode::kASCII),
            "5d41402abc4b2a76b9719d911017c592");
}

TEST_F(FingerprintBuilderTest, DefaultNormalizationFoldsUnicode) {
  auto upper = Build(FingerprintBuilder::Config{}, "D\xC3\x89" "CLARATION of Trust");
  auto lower = Build(FingerprintBuilder::Config{}, "d\xC3\xA9" "claration\xC2\xA0of trust");
  EXPECT_EQ(upper->content_hash, lower->content_hash);
  EXPECT_EQ(upper->fuzzy_hash, lower->fuzzy_hash);
}

TEST_F(FingerprintBuilderTest, FuzzyHashIsOrderInvariant) {
  EXPECT_EQ(FingerprintBuilder::FuzzyHash("tenant shall remit rent"),
            FingerprintBuilder::FuzzyHash("Rent, shall the TENANT remit!"));
  EXPECT_NE(FingerprintBuilder::FuzzyHash("tenant shall remit rent"),
            FingerprintBuilder::FuzzyHash("landlord shall remit rent"));
}

TEST_F(FingerprintBuilderTest, MetadataHashIsCanonical) {
  Json::Value a;
  a["court"] = "9th Cir.";
  a["year"] = 2021;
  Json::Value b;
  b["year"] = 2021;
  b["court"] = "9th Cir.";
  EXPECT_EQ(FingerprintBuilder::MetadataHash(a), FingerprintBuilder::MetadataHash(b));
  EXPECT_EQ(FingerprintBuilder::MetadataHash(a).size(), 32u);
}

TEST_F(FingerprintBuilderTest, MetadataHashKnownVectors) {
  // md5 of '{"a": 1, "b": "x"}'
  Json::Value m;
  m["b"] = "x";
  m["a"] = 1;
  EXPECT_EQ(FingerprintBuilder::MetadataHash(m), "4f5f4713d180fb0cb1041f7caf4faaaa");

  // md5 of '{"court": "9th Cir.", "year": 2021}'
  Json::Value court;
  court["year"] = 2021;
  court["court"] = "9th Cir.";
  EXPECT_EQ(FingerprintBuilder::MetadataHash(court), "8db99adc047b5ecccc09aa4c112996e3");

  // md5 of '{}'
  EXPECT_EQ(FingerprintBuilder::MetadataHash(Json::Value()), "99914b932bd37a50b983c5e7c90ae93b");
}

TEST_F(FingerprintBuilderTest, MetadataHashEscapesNonAscii) {
  // md5 of '{"big": 1e+16, "list": [true, null], "n": 1.0, "small": 1e-05,
  //          "title": "Déclaration"}'
  Json::Value m;
  m["title"] = "D\xC3\xA9" "claration";
  m["n"] = 1.0;
  m["big"] = 1e16;
  m["small"] = 1e-05;
  m["list"].append(true);
  m["list"].append(Json::Value());
  EXPECT_EQ(FingerprintBuilder::MetadataHash(m), "5ec58a58ac732ae2e8e7c8665689623c");
}

TEST_F(FingerprintBuilderTest, NullMetadataEqualsEmptyObject) {
  EXPECT_EQ(FingerprintBuilder::MetadataHash(Json::Value()),
            FingerprintBuilder::MetadataHash(Json::Value(Json::objectValue)));
}

TEST_F(FingerprintBuilderTest, MalformedMetadataDisablesSignal) {
  Json::Value list(Json::arrayValue);
  list.append("not an object");
  BuildReport report;
  auto fp = Build(FingerprintBuilder::Config{}, lease_, list, "", &report);
  EXPECT_TRUE(fp->metadata_hash.empty());
  EXPECT_TRUE(report.metadata_malformed);
}

// =============================================================================
// Lexical Signal Tests
// =============================================================================

TEST_F(FingerprintBuilderTest, FirstBuildFitsVocabulary) {
  EXPECT_FALSE(vectorizer_.IsFitted());
  auto fp = Build(FingerprintBuilder::Config{}, lease_);
  EXPECT_TRUE(vectorizer_.IsFitted());
  ASSERT_TRUE(fp->tfidf_vector.has_value());
  EXPECT_EQ(fp->tfidf_vector->vocabulary_id, vectorizer_.VocabularyId());
}

TEST_F(FingerprintBuilderTest, NoVectorizerMeansNoTfidf) {
  FingerprintBuilder builder(FingerprintBuilder::Config{}, nullptr);
  std::shared_ptr<DocumentFingerprint> fp;
  BuildReport report;
  ASSERT_TRUE(builder.Build("doc", lease_, Json::Value(), "", &fp, &report).ok());
  EXPECT_FALSE(fp->tfidf_vector.has_value());
  EXPECT_TRUE(report.tfidf_absent);
}

TEST_F(FingerprintBuilderTest, StructuralFeaturesExtracted) {
  auto fp = Build(FingerprintBuilder::Config{}, lease_);
  EXPECT_EQ(fp->structural_features.size(), 12u);
  EXPECT_TRUE(std::get<bool>(fp->structural_features.at("has_signature_block")));
}

// =============================================================================
// Semantic Signal Tests
// =============================================================================

TEST_F(FingerprintBuilderTest, EmbedderProducesVector) {
  FingerprintBuilder::Config config;
  config.embedder = std::make_shared<verity::testing::DeterministicEmbedder>(16);
  auto fp = Build(config, lease_);
  ASSERT_TRUE(fp->semantic_vector.has_value());
  EXPECT_EQ(fp->semantic_vector->size(), 16u);
}

TEST_F(FingerprintBuilderTest, EmbedderSeesTruncatedText) {
  auto embedder = std::make_shared<verity::testing::DeterministicEmbedder>(2);
  embedder->RegisterEmbedding("LEASE", {0.0f, 1.0f});
  FingerprintBuilder::Config config;
  config.embedder = embedder;
  config.semantic_max_chars = 5;
  auto fp = Build(config, lease_);
  ASSERT_TRUE(fp->semantic_vector.has_value());
  EXPECT_EQ(*fp->semantic_vector, (std::vector<float>{0.0f, 1.0f}));
}

TEST_F(FingerprintBuilderTest, EmbedderFailureLeavesSignalAbsent) {
  FingerprintBuilder::Config config;
  config.embedder = std::make_shared<verity::testing::FailingEmbedder>();
  BuildReport report;
  auto fp = Build(config, lease_, Json::Value(), "", &report);
  ASSERT_NE(fp, nullptr);
  EXPECT_FALSE(fp->semantic_vector.has_value());
  EXPECT_TRUE(report.embed_failed);
  EXPECT_FALSE(report.embed_timed_out);
}

TEST_F(FingerprintBuilderTest, EmbedderExceptionLeavesSignalAbsent) {
  FingerprintBuilder::Config config;
  config.embedder = std::make_shared<verity::testing::ThrowingEmbedder>();
  BuildReport report;
  auto fp = Build(config, lease_, Json::Value(), "", &report);
  EXPECT_FALSE(fp->semantic_vector.has_value());
  EXPECT_TRUE(report.embed_failed);
}

TEST_F(FingerprintBuilderTest, EmbedderExceptionInlineCall) {
  FingerprintBuilder::Config config;
  config.embedder = std::make_shared<verity::testing::ThrowingEmbedder>();
  config.embed_timeout = 0ms;
  BuildReport report;
  auto fp = Build(config, lease_, Json::Value(), "", &report);
  EXPECT_TRUE(report.embed_failed);
}

TEST_F(FingerprintBuilderTest, EmbedderTimeoutLeavesSignalAbsent) {
  FingerprintBuilder::Config config;
  config.embedder = std::make_shared<verity::testing::SlowEmbedder>(500ms);
  config.embed_timeout = 20ms;
  FingerprintBuilder builder(config, &vectorizer_);
  std::shared_ptr<DocumentFingerprint> fp;
  BuildReport report;

  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(builder.Build("doc", lease_, Json::Value(), "", &fp, &report).ok());
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(fp->semantic_vector.has_value());
  EXPECT_TRUE(report.embed_timed_out);
  EXPECT_LT(elapsed, 400ms);
}

TEST_F(FingerprintBuilderTest, HungEmbedderCallsAreCapped) {
  FingerprintBuilder::Config config;
  config.embedder = std::make_shared<verity::testing::SlowEmbedder>(300ms);
  config.embed_timeout = 20ms;
  config.collaborator_threads = 1;
  config.max_abandoned_calls = 1;
  FingerprintBuilder builder(config, &vectorizer_);

  // The first call hangs past its timeout; later builds skip the embedder
  // instead of piling more work onto the stuck thread.
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 5; ++i) {
    std::shared_ptr<DocumentFingerprint> fp;
    BuildReport report;
    ASSERT_TRUE(builder.Build("doc" + std::to_string(i), lease_, Json::Value(), "", &fp,
                              &report)
                    .ok());
    EXPECT_FALSE(fp->semantic_vector.has_value());
    EXPECT_TRUE(report.embed_timed_out);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
}

// =============================================================================
// Visual Signal Tests
// =============================================================================

TEST_F(FingerprintBuilderTest, ImageHashWhenReferenceGiven) {
  auto hasher = std::make_shared<verity::testing::ScriptedImageHasher>();
  hasher->Set("page1.png", "ffd8a0c3");
  FingerprintBuilder::Config config;
  config.image_hasher = hasher;

  auto with_image = Build(config, lease_, Json::Value(), "page1.png");
  ASSERT_TRUE(with_image->visual_hash.has_value());
  EXPECT_EQ(*with_image->visual_hash, "ffd8a0c3");

  BuildReport report;
  auto without = Build(config, lease_, Json::Value(), "", &report);
  EXPECT_FALSE(without->visual_hash.has_value());
  EXPECT_FALSE(report.visual_failed);
}

TEST_F(FingerprintBuilderTest, ImageHashFailure) {
  FingerprintBuilder::Config config;
  config.image_hasher = std::make_shared<verity::testing::ScriptedImageHasher>();
  BuildReport report;
  auto fp = Build(config, lease_, Json::Value(), "missing.png", &report);
  EXPECT_FALSE(fp->visual_hash.has_value());
  EXPECT_TRUE(report.visual_failed);
}

// =============================================================================
// Count Tests
// =============================================================================

TEST_F(FingerprintBuilderTest, CountsAndPages) {
  auto small = Build(FingerprintBuilder::Config{}, WordsText(100));
  EXPECT_EQ(small->word_count, 100u);
  EXPECT_EQ(small->page_count, 1u);

  auto big = Build(FingerprintBuilder::Config{}, WordsText(600));
  EXPECT_EQ(big->word_count, 600u);
  EXPECT_EQ(big->page_count, 2u);
}

TEST_F(FingerprintBuilderTest, CharCountIsCodePoints) {
  auto fp = Build(FingerprintBuilder::Config{}, "caf\xC3\xA9 clause");
  EXPECT_EQ(fp->char_count, 11u);
}

TEST_F(FingerprintBuilderTest, RevisionsIncrease) {
  auto first = Build(FingerprintBuilder::Config{}, lease_);
  auto second = Build(FingerprintBuilder::Config{}, lease_);
  EXPECT_GT(second->revision, first->revision);
  EXPECT_EQ(first->content_hash, second->content_hash);
  EXPECT_GE(second->created_at_us, first->created_at_us);
}

}  // namespace
}  // namespace verity
