#include <verity/fingerprint.hpp>

#include <algorithm>
#include <atomic>
#include <exception>

#include <trantor/utils/Logger.h>

#include <verity/features.hpp>
#include <verity/internal.hpp>
#include <verity/json.hpp>
#include <verity/run_control.hpp>

namespace verity {

namespace {

std::atomic<uint64_t> g_revision{0};

constexpr uint64_t kWordsPerPage = 250;

}  // namespace

FingerprintBuilder::FingerprintBuilder(Config config, TfidfVectorizer* vectorizer)
    : config_(std::move(config)), vectorizer_(vectorizer) {
  if (config_.embedder || config_.image_hasher) {
    pool_ = std::make_unique<internal::CollaboratorPool>(config_.collaborator_threads,
                                                         config_.max_abandoned_calls);
  }
}

FingerprintBuilder::~FingerprintBuilder() = default;

uint64_t FingerprintBuilder::NextRevision() {
  return g_revision.fetch_add(1, std::memory_order_relaxed) + 1;
}

std::string FingerprintBuilder::ContentHash(std::string_view text, NormalizationMode mode) {
  return internal::Md5Hex(internal::Normalize(text, mode));
}

std::string FingerprintBuilder::FuzzyHash(std::string_view text) {
  std::string joined;
  for (const std::string& word : internal::SignificantWords(text)) {
    if (!joined.empty()) joined.push_back(' ');
    joined += word;
  }
  return internal::Sha256Hex(joined);
}

std::string FingerprintBuilder::MetadataHash(const Json::Value& metadata) {
  if (metadata.isNull()) return internal::Md5Hex("{}");
  if (!metadata.isObject()) return std::string();

  return internal::Md5Hex(WriteSortedJson(metadata));
}

rocksdb::Status FingerprintBuilder::Build(std::string_view document_id,
                                          std::string_view text,
                                          const Json::Value& metadata,
                                          std::string_view image_ref,
                                          std::shared_ptr<DocumentFingerprint>* out,
                                          BuildReport* report) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (document_id.empty()) return rocksdb::Status::InvalidArgument("document_id is empty");

  BuildReport local;
  BuildReport& rep = report ? *report : local;
  rep = BuildReport{};

  auto fp = std::make_shared<DocumentFingerprint>();
  fp->document_id = std::string(document_id);
  fp->content_hash = ContentHash(text, config_.normalization);
  fp->fuzzy_hash = FuzzyHash(text);
  fp->metadata_hash = MetadataHash(metadata);
  if (fp->metadata_hash.empty()) {
    rep.metadata_malformed = true;
    LOG_WARN << "document " << fp->document_id
             << ": metadata is not a JSON object; metadata signal disabled";
  }
  fp->structural_features = ExtractStructuralFeatures(text);

  if (vectorizer_) {
    if (!vectorizer_->IsFitted()) {
      rocksdb::Status s = vectorizer_->FitIfEmpty(text);
      if (!s.ok()) {
        LOG_WARN << "document " << fp->document_id
                 << ": cannot fit TF-IDF vocabulary: " << s.ToString();
      }
    }
    fp->tfidf_vector = vectorizer_->Transform(text);
  }
  rep.tfidf_absent = !fp->tfidf_vector.has_value();

  if (config_.embedder) {
    std::shared_ptr<Embedder> embedder = config_.embedder;
    std::string input(internal::TruncateCodePoints(text, config_.semantic_max_chars));
    EmbeddingResult result;
    auto outcome = internal::CollaboratorPool::Outcome::kFinished;
    try {
      outcome = pool_->Call<EmbeddingResult>(
          [embedder, input = std::move(input)]() { return embedder->Embed(input); },
          config_.embed_timeout, &result);
    } catch (const std::exception& e) {
      result.success = false;
      result.error_message = e.what();
    }

    if (outcome == internal::CollaboratorPool::Outcome::kTimedOut) {
      rep.embed_timed_out = true;
      LOG_WARN << "document " << fp->document_id << ": embedding timed out after "
               << config_.embed_timeout.count() << "ms";
    } else if (outcome == internal::CollaboratorPool::Outcome::kRejected) {
      rep.embed_timed_out = true;
      LOG_WARN << "document " << fp->document_id << ": embedding skipped, "
               << pool_->Abandoned() << " timed-out calls still running";
    } else if (!result.success || result.embedding.empty()) {
      rep.embed_failed = true;
      LOG_WARN << "document " << fp->document_id
               << ": embedding failed: " << result.error_message;
    } else {
      fp->semantic_vector = std::move(result.embedding);
    }
  }

  if (config_.image_hasher && !image_ref.empty()) {
    std::shared_ptr<ImageHasher> hasher = config_.image_hasher;
    ImageHashResult result;
    auto outcome = internal::CollaboratorPool::Outcome::kFinished;
    try {
      outcome = pool_->Call<ImageHashResult>(
          [hasher, ref = std::string(image_ref)]() { return hasher->PerceptualHash(ref); },
          config_.image_hash_timeout, &result);
    } catch (const std::exception& e) {
      result.success = false;
      result.error_message = e.what();
    }

    if (outcome == internal::CollaboratorPool::Outcome::kTimedOut) {
      rep.visual_timed_out = true;
      LOG_WARN << "document " << fp->document_id << ": image hashing timed out after "
               << config_.image_hash_timeout.count() << "ms";
    } else if (outcome == internal::CollaboratorPool::Outcome::kRejected) {
      rep.visual_timed_out = true;
      LOG_WARN << "document " << fp->document_id << ": image hashing skipped, "
               << pool_->Abandoned() << " timed-out calls still running";
    } else if (!result.success || result.hash.empty()) {
      rep.visual_failed = true;
      LOG_WARN << "document " << fp->document_id
               << ": image hashing failed: " << result.error_message;
    } else {
      fp->visual_hash = std::move(result.hash);
    }
  }

  fp->word_count = internal::CountWords(text);
  fp->char_count = internal::CountCodePoints(text);
  fp->page_count = std::max<uint64_t>(1, fp->word_count / kWordsPerPage);
  fp->created_at_us = internal::WallClockMicros();
  fp->revision = NextRevision();

  LOG_DEBUG << "fingerprinted " << fp->document_id << " words=" << fp->word_count
            << " tfidf=" << (fp->tfidf_vector ? "yes" : "no")
            << " semantic=" << (fp->semantic_vector ? "yes" : "no")
            << " visual=" << (fp->visual_hash ? "yes" : "no");

  *out = std::move(fp);
  return rocksdb::Status::OK();
}

}  // namespace verity
