// Unit tests for verity/features.hpp
// Tests: structural feature extraction and feature-map similarity

#include <gtest/gtest.h>

#include <verity/features.hpp>

#include <string>

namespace verity {
namespace {

double Number(const StructuralFeatures& f, const char* key) {
  auto it = f.find(key);
  if (it == f.end()) {
    ADD_FAILURE() << "missing feature " << key;
    return -1;
  }
  return std::get<double>(it->second);
}

bool Flag(const StructuralFeatures& f, const char* key) {
  auto it = f.find(key);
  if (it == f.end()) {
    ADD_FAILURE() << "missing feature " << key;
    return false;
  }
  return std::get<bool>(it->second);
}

// =============================================================================
// Extraction Tests
// =============================================================================

class ExtractFeaturesTest : public ::testing::Test {
 protected:
  const std::string contract_ =
      "SERVICES AGREEMENT\n"
      "\n"
      "This Agreement is made between Acme (the \"Provider\") and the Client Party.\n"
      "WHEREAS the Provider offers services; whereas-like words do not count.\n"
      "\n"
      "1. Services. The Provider shall perform the services.\n"
      "2. Fees. See 410 U.S. 113 for guidance!\n"
      "  10. Survival.\n"
      "\n"
      "Signature: __________ Date: 2024-05-01";
};

TEST_F(ExtractFeaturesTest, ProducesEveryFeature) {
  auto f = ExtractStructuralFeatures(contract_);
  EXPECT_EQ(f.size(), 12u);
}

TEST_F(ExtractFeaturesTest, LayoutCounts) {
  auto f = ExtractStructuralFeatures(contract_);
  EXPECT_EQ(Number(f, feature::kLineCount), 10);
  EXPECT_EQ(Number(f, feature::kParagraphCount), 4);
  EXPECT_EQ(Number(f, feature::kNumberedSections), 3);
}

TEST_F(ExtractFeaturesTest, BoilerplateFlags) {
  auto f = ExtractStructuralFeatures(contract_);
  EXPECT_TRUE(Flag(f, feature::kHasSignatureBlock));
  EXPECT_TRUE(Flag(f, feature::kHasDateLine));
  EXPECT_TRUE(Flag(f, feature::kHasParties));
}

TEST_F(ExtractFeaturesTest, WhereasCountsWholeWordsOnly) {
  auto f = ExtractStructuralFeatures(contract_);
  // "WHEREAS" and "whereas" in "whereas-like" (the hyphen is a boundary)
  EXPECT_EQ(Number(f, feature::kWhereasClauses), 2);
  EXPECT_EQ(Number(ExtractStructuralFeatures("thereas whereasx"), feature::kWhereasClauses), 0);
}

TEST_F(ExtractFeaturesTest, Spans) {
  auto f = ExtractStructuralFeatures(contract_);
  EXPECT_EQ(Number(f, feature::kQuotedText), 1);
  EXPECT_EQ(Number(f, feature::kParentheticalText), 1);
}

TEST_F(ExtractFeaturesTest, CapitalizedWords) {
  auto f = ExtractStructuralFeatures("SERVICES AGREEMENT by ACME, a US Corp. I agree.");
  // SERVICES, AGREEMENT, ACME, US; "Corp" and "I" do not qualify
  EXPECT_EQ(Number(f, feature::kCapitalizedWords), 4);
}

TEST_F(ExtractFeaturesTest, Citations) {
  auto f = ExtractStructuralFeatures("See 5 Cal. 4 and 12 Wash. 2d 7, not 12 abc 3.");
  EXPECT_EQ(Number(f, feature::kCitationCount), 2);
  EXPECT_EQ(Number(ExtractStructuralFeatures("410 U.S. 113"), feature::kCitationCount), 0);
}

TEST_F(ExtractFeaturesTest, CitationsDoNotOverlap) {
  // The first match takes "2", so "Cd 3" has no leading volume number
  EXPECT_EQ(Number(ExtractStructuralFeatures("1 Ab 2 Cd 3"), feature::kCitationCount), 1);
  // A failed start is retried at the next number
  EXPECT_EQ(Number(ExtractStructuralFeatures("1 2 Ab 3"), feature::kCitationCount), 1);
  EXPECT_EQ(Number(ExtractStructuralFeatures("5 Ab3 4"), feature::kCitationCount), 0);
  EXPECT_EQ(Number(ExtractStructuralFeatures("7\t\nF.\t9"), feature::kCitationCount), 1);
}

TEST_F(ExtractFeaturesTest, LongReporterRunIsLinear) {
  // Dot leaders and unspaced OCR output produce very long [a-z.] runs
  const std::string letters = "See 12 A" + std::string(200000, 'a') + " 34 for details.";
  EXPECT_EQ(Number(ExtractStructuralFeatures(letters), feature::kCitationCount), 1);

  const std::string leaders = "Section 1 T" + std::string(200000, '.') + " 9";
  EXPECT_EQ(Number(ExtractStructuralFeatures(leaders), feature::kCitationCount), 1);

  const std::string unterminated = "12 A" + std::string(200000, 'a');
  EXPECT_EQ(Number(ExtractStructuralFeatures(unterminated), feature::kCitationCount), 0);
}

TEST_F(ExtractFeaturesTest, SentencesCountTerminalRuns) {
  EXPECT_EQ(Number(ExtractStructuralFeatures("One. Two?! Three..."), feature::kSentenceCount), 4);
  EXPECT_EQ(Number(ExtractStructuralFeatures("no terminator"), feature::kSentenceCount), 1);
}

TEST_F(ExtractFeaturesTest, EmptyText) {
  auto f = ExtractStructuralFeatures("");
  EXPECT_EQ(Number(f, feature::kLineCount), 1);
  EXPECT_EQ(Number(f, feature::kParagraphCount), 1);
  EXPECT_FALSE(Flag(f, feature::kHasSignatureBlock));
  EXPECT_EQ(Number(f, feature::kCitationCount), 0);
}

TEST_F(ExtractFeaturesTest, KeywordsAreCaseInsensitive) {
  auto f = ExtractStructuralFeatures("EXECUTED by the DEFENDANT. DATED today.");
  EXPECT_TRUE(Flag(f, feature::kHasSignatureBlock));
  EXPECT_TRUE(Flag(f, feature::kHasParties));
  EXPECT_TRUE(Flag(f, feature::kHasDateLine));
}

// =============================================================================
// Similarity Tests
// =============================================================================

class StructuralSimilarityTest : public ::testing::Test {};

TEST_F(StructuralSimilarityTest, IdenticalMapsScoreOne) {
  auto f = ExtractStructuralFeatures("1. Terms.\n2. Price.\nSigned by the Parties.");
  EXPECT_DOUBLE_EQ(StructuralSimilarity(f, f), 1.0);
}

TEST_F(StructuralSimilarityTest, EmptyMapScoresZero) {
  StructuralFeatures f;
  f["line_count"] = 3.0;
  EXPECT_EQ(StructuralSimilarity(f, {}), 0.0);
  EXPECT_EQ(StructuralSimilarity({}, f), 0.0);
  EXPECT_EQ(StructuralSimilarity({}, {}), 0.0);
}

TEST_F(StructuralSimilarityTest, NumbersUseMinOverMax) {
  StructuralFeatures a, b;
  a["line_count"] = 10.0;
  b["line_count"] = 40.0;
  EXPECT_DOUBLE_EQ(StructuralSimilarity(a, b), 0.25);
}

TEST_F(StructuralSimilarityTest, ZeroHandling) {
  StructuralFeatures a, b;
  a["x"] = 0.0;
  b["x"] = 0.0;
  a["y"] = 0.0;
  b["y"] = 5.0;
  // x: both zero = 1, y: one zero = 0
  EXPECT_DOUBLE_EQ(StructuralSimilarity(a, b), 0.5);
}

TEST_F(StructuralSimilarityTest, FlagsCompareByEquality) {
  StructuralFeatures a, b;
  a["signed"] = true;
  b["signed"] = false;
  a["dated"] = false;
  b["dated"] = false;
  EXPECT_DOUBLE_EQ(StructuralSimilarity(a, b), 0.5);
}

TEST_F(StructuralSimilarityTest, MissingKeyCountsAsZero) {
  StructuralFeatures a, b;
  a["line_count"] = 4.0;
  a["quoted_text"] = 2.0;
  b["line_count"] = 4.0;
  // quoted_text: 2 vs missing (0) scores 0
  EXPECT_DOUBLE_EQ(StructuralSimilarity(a, b), 0.5);
}

TEST_F(StructuralSimilarityTest, Symmetric) {
  auto a = ExtractStructuralFeatures("WHEREAS (a) \"b\"\n\n1. One.\nSigned.");
  auto b = ExtractStructuralFeatures("Dated 2024.\n2. Two. 410 U.S. 113");
  EXPECT_DOUBLE_EQ(StructuralSimilarity(a, b), StructuralSimilarity(b, a));
  double s = StructuralSimilarity(a, b);
  EXPECT_GE(s, 0.0);
  EXPECT_LE(s, 1.0);
}

}  // namespace
}  // namespace verity
