// Unit tests for verity/fingerprint_store.hpp
// Tests: FingerprintStore operations and Detector reopen from db_path

#include <gtest/gtest.h>

#include <verity/detector.hpp>
#include <verity/fingerprint_store.hpp>
#include <verity/test_utils.hpp>

#include <rocksdb/db.h>

#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace verity {
namespace {

using verity::testing::MakeFingerprint;

// =============================================================================
// Test Fixture
// =============================================================================

class FingerprintStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / ("verity_store_test_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "db").string();
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  rocksdb::Status OpenStore() { return FingerprintStore::Open(db_path_, &store_); }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<FingerprintStore> store_;
};

// =============================================================================
// Open / Close
// =============================================================================

TEST_F(FingerprintStoreTest, OpenCreatesDatabase) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(std::filesystem::exists(db_path_));
}

TEST_F(FingerprintStoreTest, OpenRejectsEmptyPath) {
  EXPECT_TRUE(FingerprintStore::Open("", &store_).IsInvalidArgument());
  EXPECT_EQ(store_, nullptr);
}

TEST_F(FingerprintStoreTest, CloseIsIdempotent) {
  ASSERT_TRUE(OpenStore().ok());
  store_->Close();
  store_->Close();
  EXPECT_TRUE(store_->Put(*MakeFingerprint("a", "h")).IsInvalidArgument());
  std::vector<std::shared_ptr<DocumentFingerprint>> all;
  EXPECT_TRUE(store_->LoadAll(&all).IsInvalidArgument());
}

// =============================================================================
// Fingerprints
// =============================================================================

TEST_F(FingerprintStoreTest, PutAndLoadAll) {
  ASSERT_TRUE(OpenStore().ok());
  auto b = MakeFingerprint("b", "hash-b", 300, 20);
  b->semantic_vector = std::vector<float>{0.6f, 0.8f};
  ASSERT_TRUE(store_->Put(*b).ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("a", "hash-a", 100, 10)).ok());

  std::vector<std::shared_ptr<DocumentFingerprint>> all;
  uint64_t skipped = 99;
  ASSERT_TRUE(store_->LoadAll(&all, &skipped).ok());
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(skipped, 0u);

  EXPECT_EQ(all[0]->document_id, "a");
  EXPECT_EQ(all[1]->document_id, "b");
  EXPECT_EQ(all[1]->content_hash, "hash-b");
  EXPECT_EQ(all[1]->word_count, 300u);
  EXPECT_EQ(all[1]->created_at_us, 20u);
  ASSERT_TRUE(all[1]->semantic_vector.has_value());
  EXPECT_EQ(*all[1]->semantic_vector, (std::vector<float>{0.6f, 0.8f}));
}

TEST_F(FingerprintStoreTest, PutOverwrites) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("a", "old")).ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("a", "new")).ok());

  std::vector<std::shared_ptr<DocumentFingerprint>> all;
  ASSERT_TRUE(store_->LoadAll(&all).ok());
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0]->content_hash, "new");
}

TEST_F(FingerprintStoreTest, PutRejectsEmptyId) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(store_->Put(*MakeFingerprint("", "h")).IsInvalidArgument());
}

TEST_F(FingerprintStoreTest, Delete) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("a", "h1")).ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("b", "h2")).ok());
  ASSERT_TRUE(store_->Delete("a").ok());

  std::vector<std::shared_ptr<DocumentFingerprint>> all;
  ASSERT_TRUE(store_->LoadAll(&all).ok());
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0]->document_id, "b");
}

TEST_F(FingerprintStoreTest, SurvivesReopen) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("a", "h1")).ok());
  store_.reset();

  ASSERT_TRUE(OpenStore().ok());
  std::vector<std::shared_ptr<DocumentFingerprint>> all;
  ASSERT_TRUE(store_->LoadAll(&all).ok());
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0]->content_hash, "h1");
}

TEST_F(FingerprintStoreTest, UndecodableRecordsAreSkipped) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put(*MakeFingerprint("good", "h")).ok());
  store_.reset();

  // Write garbage straight into the fingerprint column family.
  {
    std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
    cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, rocksdb::ColumnFamilyOptions());
    cfs.emplace_back("verity_fingerprints", rocksdb::ColumnFamilyOptions());
    cfs.emplace_back("verity_meta", rocksdb::ColumnFamilyOptions());
    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::DB* raw = nullptr;
    ASSERT_TRUE(rocksdb::DB::Open(rocksdb::DBOptions(), db_path_, cfs, &handles, &raw).ok());
    ASSERT_TRUE(raw->Put(rocksdb::WriteOptions(), handles[1], "bad", "\xEE\x01garbage").ok());
    for (auto* h : handles) ASSERT_TRUE(raw->DestroyColumnFamilyHandle(h).ok());
    delete raw;
  }

  ASSERT_TRUE(OpenStore().ok());
  std::vector<std::shared_ptr<DocumentFingerprint>> all;
  uint64_t skipped = 0;
  ASSERT_TRUE(store_->LoadAll(&all, &skipped).ok());
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0]->document_id, "good");
  EXPECT_EQ(skipped, 1u);
}

// =============================================================================
// Vocabulary
// =============================================================================

TEST_F(FingerprintStoreTest, VocabularyNotFoundUntilStored) {
  ASSERT_TRUE(OpenStore().ok());
  std::string encoded;
  EXPECT_TRUE(store_->GetVocabulary(&encoded).IsNotFound());

  ASSERT_TRUE(store_->PutVocabulary("vocabulary-bytes").ok());
  ASSERT_TRUE(store_->GetVocabulary(&encoded).ok());
  EXPECT_EQ(encoded, "vocabulary-bytes");
}

// =============================================================================
// Detector Persistence
// =============================================================================

class DetectorPersistenceTest : public FingerprintStoreTest {
 protected:
  std::unique_ptr<Detector> OpenDetector() {
    Options opt;
    opt.db_path = db_path_;
    opt.similarity_threshold = 0.5;
    std::unique_ptr<Detector> detector;
    auto s = Detector::Open(opt, &detector);
    EXPECT_TRUE(s.ok()) << s.ToString();
    return detector;
  }

  const std::string nda_ =
      "MUTUAL NON-DISCLOSURE AGREEMENT\n\n1. Confidential Information. Each party "
      "shall protect the other party's confidential information.\n2. Term. This "
      "agreement lasts two years.\nSigned by the parties.";
};

TEST_F(DetectorPersistenceTest, FingerprintsSurviveRestart) {
  {
    auto detector = OpenDetector();
    ASSERT_NE(detector, nullptr);
    ASSERT_TRUE(detector->CreateFingerprint("nda-1", nda_).ok());
    ASSERT_TRUE(detector->CreateFingerprint("nda-2", nda_).ok());
    ASSERT_TRUE(detector->CreateFingerprint("memo", "Lunch is at noon on Friday.").ok());
    ASSERT_TRUE(detector->RemoveFingerprint("memo").ok());
  }

  auto detector = OpenDetector();
  ASSERT_NE(detector, nullptr);
  Statistics stats = detector->GetStatistics();
  EXPECT_EQ(stats.total_documents, 2u);
  EXPECT_GT(stats.tfidf_vocabulary_size, 0u);
  EXPECT_EQ(stats.cached_comparisons, 0u);

  FingerprintPtr fp;
  EXPECT_TRUE(detector->GetFingerprint("memo", &fp).IsNotFound());
  ASSERT_TRUE(detector->GetFingerprint("nda-1", &fp).ok());
  EXPECT_TRUE(fp->tfidf_vector.has_value());

  std::vector<DuplicateMatch> matches;
  ASSERT_TRUE(detector->FindDuplicates("nda-1", nullptr, &matches).ok());
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].document_id_2, "nda-2");
  EXPECT_EQ(matches[0].duplicate_type, DuplicateType::kExact);
}

TEST_F(DetectorPersistenceTest, ReloadedVectorsStayComparable) {
  {
    auto detector = OpenDetector();
    ASSERT_TRUE(detector->CreateFingerprint("nda-1", nda_).ok());
  }

  auto detector = OpenDetector();
  ASSERT_TRUE(detector->CreateFingerprint("nda-2", nda_ + "\nAmended.").ok());

  FingerprintPtr a;
  FingerprintPtr b;
  ASSERT_TRUE(detector->GetFingerprint("nda-1", &a).ok());
  ASSERT_TRUE(detector->GetFingerprint("nda-2", &b).ok());
  ASSERT_TRUE(a->tfidf_vector && b->tfidf_vector);
  EXPECT_EQ(a->tfidf_vector->vocabulary_id, b->tfidf_vector->vocabulary_id);

  std::optional<DuplicateMatch> match;
  ASSERT_TRUE(detector->Compare("nda-1", "nda-2", &match).ok());
  ASSERT_TRUE(match.has_value());
  EXPECT_GT(match->details.scores.tfidf, 0.9);
}

TEST_F(DetectorPersistenceTest, RefitAfterRestartGetsFreshVocabularyId) {
  uint64_t old_id = 0;
  {
    auto detector = OpenDetector();
    ASSERT_TRUE(detector->CreateFingerprint("nda-1", nda_).ok());
    FingerprintPtr fp;
    ASSERT_TRUE(detector->GetFingerprint("nda-1", &fp).ok());
    old_id = fp->tfidf_vector->vocabulary_id;
  }

  auto detector = OpenDetector();
  ASSERT_TRUE(detector->FitVocabulary({"an unrelated corpus of words", "another text"}).ok());
  ASSERT_TRUE(detector->CreateFingerprint("memo", "another text of words").ok());

  FingerprintPtr fp;
  ASSERT_TRUE(detector->GetFingerprint("memo", &fp).ok());
  ASSERT_TRUE(fp->tfidf_vector.has_value());
  EXPECT_GT(fp->tfidf_vector->vocabulary_id, old_id);
}

}  // namespace
}  // namespace verity
