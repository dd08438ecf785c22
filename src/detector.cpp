#include <verity/detector.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <set>
#include <thread>
#include <unordered_map>

#include <trantor/utils/Logger.h>

#include <verity/candidate_index.hpp>
#include <verity/clusters.hpp>
#include <verity/comparator.hpp>
#include <verity/fingerprint.hpp>
#include <verity/fingerprint_store.hpp>
#include <verity/internal.hpp>
#include <verity/registry.hpp>
#include <verity/tfidf.hpp>

namespace verity {

namespace {

// Scores closer than this are the same score.
constexpr double kScoreEpsilon = 1e-9;

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics && delta > 0) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const Options& opt, std::string_view name, uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

inline void EmitGauge(const Options& opt, std::string_view name, double value) {
  if (opt.metrics) opt.metrics->Gauge(name, value);
}

// Map statuses to low-cardinality strings for tracing.
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  return "other";
}

inline void SpanAttr(TraceSpan* span, std::string_view key, uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(TraceSpan* span, std::string_view key, std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanEvent(TraceSpan* span, std::string_view name) {
  if (span) span->AddEvent(name);
}

// Counts a bulk call's outcome under `prefix` and closes its span.
class OpScope {
 public:
  OpScope(const Options& opt, std::string_view prefix, std::string_view span_name)
      : opt_(opt), prefix_(prefix), start_us_(internal::NowMicros()) {
    EmitCounter(opt_, prefix_ + ".calls");
    if (opt_.tracer) span_ = opt_.tracer->StartSpan(span_name);
  }

  TraceSpan* span() const { return span_.get(); }

  rocksdb::Status Finish(const rocksdb::Status& st) {
    const uint64_t dur_us = internal::NowMicros() - start_us_;
    EmitHistogram(opt_, prefix_ + ".latency_us", dur_us);
    if (st.ok()) {
      EmitCounter(opt_, prefix_ + ".ok_total");
    } else if (st.IsNotFound()) {
      EmitCounter(opt_, prefix_ + ".not_found_total");
    } else if (st.IsAborted()) {
      EmitCounter(opt_, prefix_ + ".aborted_total");
    } else if (st.IsTimedOut()) {
      EmitCounter(opt_, prefix_ + ".timed_out_total");
    } else {
      EmitCounter(opt_, prefix_ + ".error_total");
    }
    if (span_) {
      SpanAttr(span_.get(), "latency_us", dur_us);
      SpanAttr(span_.get(), "status", StatusKind(st));
      span_->End(st);
      span_.reset();
    }
    return st;
  }

 private:
  const Options& opt_;
  std::string prefix_;
  uint64_t start_us_;
  std::unique_ptr<TraceSpan> span_;
};

void SortMatches(std::vector<DuplicateMatch>* matches) {
  std::sort(matches->begin(), matches->end(),
            [](const DuplicateMatch& a, const DuplicateMatch& b) {
              if (a.similarity_score != b.similarity_score) {
                return a.similarity_score > b.similarity_score;
              }
              if (a.document_id_1 != b.document_id_1) return a.document_id_1 < b.document_id_1;
              return a.document_id_2 < b.document_id_2;
            });
}

rocksdb::Status ValidateOptions(const Options& opt) {
  if (!(opt.similarity_threshold >= 0.0 && opt.similarity_threshold <= 1.0)) {
    return rocksdb::Status::InvalidArgument("similarity_threshold must be in [0, 1]");
  }
  if (opt.comparison_threads < 0) {
    return rocksdb::Status::InvalidArgument("comparison_threads must be >= 0");
  }
  if (opt.cache_shards == 0 || opt.registry_shards == 0) {
    return rocksdb::Status::InvalidArgument("shard counts must be positive");
  }
  if (opt.tfidf_ngram_max < 1) {
    return rocksdb::Status::InvalidArgument("tfidf_ngram_max must be >= 1");
  }
  if (opt.embed_timeout_ms < 0 || opt.image_hash_timeout_ms < 0) {
    return rocksdb::Status::InvalidArgument("collaborator timeouts must be >= 0");
  }
  if (opt.collaborator_threads < 1 || opt.max_abandoned_collaborator_calls < 1) {
    return rocksdb::Status::InvalidArgument(
        "collaborator_threads and max_abandoned_collaborator_calls must be >= 1");
  }
  if (opt.use_candidate_index) {
#ifndef VERITY_ENABLE_SEMANTIC
    return rocksdb::Status::InvalidArgument(
        "Candidate index not enabled. Rebuild with VERITY_ENABLE_SEMANTIC=ON");
#else
    if (opt.candidate_k <= 0) {
      return rocksdb::Status::InvalidArgument("candidate_k must be positive");
    }
#endif
  }
  return rocksdb::Status::OK();
}

}  // namespace

Detector::Detector(const Options& opt) : opt_(opt) {}

Detector::~Detector() { Close(); }

rocksdb::Status Detector::Open(const Options& opt, std::unique_ptr<Detector>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  rocksdb::Status s = ValidateOptions(opt);
  if (!s.ok()) return s;

  auto detector = std::unique_ptr<Detector>(new Detector(opt));

  if (!detector->opt_.embedder && !opt.semantic_model_path.empty()) {
    std::string embedder_error;
    std::unique_ptr<Embedder> embedder =
        Embedder::CreateOnnx(opt.semantic_model_path, opt.semantic_model_type,
                             opt.semantic_num_threads, &embedder_error);
    if (!embedder) {
      return rocksdb::Status::InvalidArgument("Failed to create embedder: " + embedder_error);
    }
    detector->opt_.embedder = std::move(embedder);
  }

  TfidfOptions tfidf;
  tfidf.max_features = opt.tfidf_max_features;
  tfidf.ngram_max = opt.tfidf_ngram_max;
  detector->vectorizer_ = std::make_unique<TfidfVectorizer>(tfidf);

  FingerprintBuilder::Config config;
  config.normalization = opt.normalization;
  config.semantic_max_chars = opt.semantic_max_chars;
  config.embed_timeout = std::chrono::milliseconds(opt.embed_timeout_ms);
  config.image_hash_timeout = std::chrono::milliseconds(opt.image_hash_timeout_ms);
  config.embedder = detector->opt_.embedder;
  config.image_hasher = opt.image_hasher;
  config.collaborator_threads = static_cast<size_t>(opt.collaborator_threads);
  config.max_abandoned_calls = static_cast<size_t>(opt.max_abandoned_collaborator_calls);
  detector->builder_ =
      std::make_unique<FingerprintBuilder>(std::move(config), detector->vectorizer_.get());

  detector->registry_ = std::make_unique<FingerprintRegistry>(opt.registry_shards);
  detector->cache_ = std::make_unique<ComparisonCache>(opt.cache_shards);

  if (!opt.db_path.empty()) {
    StoreOptions store_opt;
    store_opt.sync_writes = opt.sync_writes;
    s = FingerprintStore::Open(opt.db_path, &detector->store_, store_opt);
    if (!s.ok()) {
      LOG_ERROR << "cannot open fingerprint store at " << opt.db_path << ": " << s.ToString();
      return s;
    }
    s = detector->LoadFromStore();
    if (!s.ok()) return s;
  }

  *out = std::move(detector);
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::LoadFromStore() {
  std::string vocabulary;
  rocksdb::Status s = store_->GetVocabulary(&vocabulary);
  if (s.ok()) {
    s = vectorizer_->DecodeVocabulary(vocabulary);
    if (!s.ok()) {
      LOG_ERROR << "stored TF-IDF vocabulary is unreadable: " << s.ToString();
      return s;
    }
  } else if (!s.IsNotFound()) {
    return s;
  }

  std::vector<std::shared_ptr<DocumentFingerprint>> loaded;
  uint64_t skipped = 0;
  s = store_->LoadAll(&loaded, &skipped);
  if (!s.ok()) {
    LOG_ERROR << "loading fingerprints: " << s.ToString();
    return s;
  }

  for (auto& fp : loaded) {
    fp->revision = FingerprintBuilder::NextRevision();
    if (fp->tfidf_vector) vectorizer_->ReserveVocabularyIds(fp->tfidf_vector->vocabulary_id);
    IndexFingerprint(*fp);
    registry_->Put(std::move(fp));
  }

  if (skipped > 0) EmitCounter(opt_, "verity.store.skipped_total", skipped);
  EmitGauge(opt_, "verity.registry.documents", static_cast<double>(registry_->Size()));
  LOG_INFO << "loaded " << loaded.size() << " fingerprints from " << opt_.db_path
           << " (skipped " << skipped << ")";
  return rocksdb::Status::OK();
}

void Detector::Close() {
  if (closed_.exchange(true)) return;
  if (store_) store_->Close();
}

// ---------------------------------------------------------------------------
// Fingerprints
// ---------------------------------------------------------------------------

rocksdb::Status Detector::CreateFingerprint(std::string_view document_id,
                                            std::string_view text,
                                            const Json::Value& metadata,
                                            std::string_view image_ref,
                                            FingerprintPtr* out) {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");

  EmitCounter(opt_, "verity.fingerprint.calls");
  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("verity.CreateFingerprint");
  SpanAttr(span.get(), "text_bytes", static_cast<uint64_t>(text.size()));

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    EmitHistogram(opt_, "verity.fingerprint.latency_us", dur_us);
    EmitCounter(opt_, st.ok() ? "verity.fingerprint.ok_total" : "verity.fingerprint.error_total");
    if (span) {
      SpanAttr(span.get(), "latency_us", dur_us);
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  const uint64_t vocabulary_before = vectorizer_->VocabularyId();

  std::shared_ptr<DocumentFingerprint> fp;
  BuildReport report;
  rocksdb::Status s = builder_->Build(document_id, text, metadata, image_ref, &fp, &report);
  if (!s.ok()) return finish(s);

  if (report.embed_failed) EmitCounter(opt_, "verity.fingerprint.embed_failures_total");
  if (report.embed_timed_out) EmitCounter(opt_, "verity.fingerprint.embed_timeouts_total");
  if (report.visual_failed) EmitCounter(opt_, "verity.fingerprint.visual_failures_total");
  if (report.visual_timed_out) EmitCounter(opt_, "verity.fingerprint.visual_timeouts_total");
  if (report.metadata_malformed) EmitCounter(opt_, "verity.fingerprint.metadata_malformed_total");
  if (report.tfidf_absent) EmitCounter(opt_, "verity.fingerprint.tfidf_absent_total");

  if (store_) {
    if (vectorizer_->VocabularyId() != vocabulary_before) {
      s = store_->PutVocabulary(vectorizer_->EncodeVocabulary());
      if (!s.ok()) {
        LOG_ERROR << "persisting TF-IDF vocabulary: " << s.ToString();
        return finish(s);
      }
    }
    s = store_->Put(*fp);
    if (!s.ok()) {
      LOG_ERROR << "persisting fingerprint " << fp->document_id << ": " << s.ToString();
      return finish(s);
    }
  }

  IndexFingerprint(*fp);
  FingerprintPtr shared = fp;
  FingerprintPtr previous = registry_->Put(shared);
  const size_t evicted = cache_->Invalidate(shared->document_id);
  EmitCounter(opt_, "verity.cache.evicted_total", evicted);
  if (previous) SpanEvent(span.get(), "replaced");
  SpanAttr(span.get(), "cache_evicted", static_cast<uint64_t>(evicted));
  EmitGauge(opt_, "verity.registry.documents", static_cast<double>(registry_->Size()));

  if (out) *out = std::move(shared);
  return finish(rocksdb::Status::OK());
}

rocksdb::Status Detector::FitVocabulary(const std::vector<std::string>& texts,
                                        size_t* vocabulary_size) {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");

  rocksdb::Status s = vectorizer_->Fit(texts);
  if (!s.ok()) return s;

  if (store_) {
    s = store_->PutVocabulary(vectorizer_->EncodeVocabulary());
    if (!s.ok()) {
      LOG_ERROR << "persisting TF-IDF vocabulary: " << s.ToString();
      return s;
    }
  }

  const size_t size = vectorizer_->VocabularySize();
  LOG_INFO << "fitted TF-IDF vocabulary " << vectorizer_->VocabularyId() << " on "
           << texts.size() << " documents: " << size << " terms";
  EmitGauge(opt_, "verity.tfidf.vocabulary_size", static_cast<double>(size));
  if (vocabulary_size) *vocabulary_size = size;
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::GetFingerprint(std::string_view document_id, FingerprintPtr* out) const {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  FingerprintPtr fp = registry_->Get(document_id);
  if (!fp) return rocksdb::Status::NotFound("no fingerprint for " + std::string(document_id));
  *out = std::move(fp);
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::RemoveFingerprint(std::string_view document_id) {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");

  FingerprintPtr removed = registry_->Remove(document_id);
  if (!removed) return rocksdb::Status::NotFound("no fingerprint for " + std::string(document_id));

  EmitCounter(opt_, "verity.cache.evicted_total", cache_->Invalidate(document_id));
  UnindexFingerprint(removed->document_id);
  EmitGauge(opt_, "verity.registry.documents", static_cast<double>(registry_->Size()));

  if (store_) {
    rocksdb::Status s = store_->Delete(document_id);
    if (!s.ok()) {
      LOG_ERROR << "deleting stored fingerprint " << removed->document_id << ": "
                << s.ToString();
      return s;
    }
  }
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Candidate index
// ---------------------------------------------------------------------------

void Detector::IndexFingerprint(const DocumentFingerprint& fp) {
  if (!opt_.use_candidate_index) return;
  std::lock_guard<std::mutex> lock(index_mu_);

  if (!fp.semantic_vector) {
    if (index_) index_->Remove(fp.document_id);
    return;
  }
  if (!index_) {
    index_ = CreateHnswCandidateIndex(fp.semantic_vector->size(), 1024, opt_.hnsw_m,
                                      opt_.hnsw_ef_construction, opt_.hnsw_ef_search);
    if (!index_) {
      LOG_WARN << "cannot create candidate index; batch detection compares every pair";
      return;
    }
  }
  if (!index_->Upsert(fp.document_id, *fp.semantic_vector)) {
    // Dimension mismatch: the document is compared against everything.
    index_->Remove(fp.document_id);
    LOG_WARN << "document " << fp.document_id << ": vector dimension "
             << fp.semantic_vector->size() << " does not match candidate index dimension "
             << index_->Dimension();
  }
}

void Detector::UnindexFingerprint(const std::string& document_id) {
  if (!opt_.use_candidate_index) return;
  std::lock_guard<std::mutex> lock(index_mu_);
  if (index_) index_->Remove(document_id);
}

std::optional<std::vector<std::vector<size_t>>> Detector::CandidateRows(
    const std::vector<FingerprintPtr>& fps) const {
  if (!opt_.use_candidate_index) return std::nullopt;

  std::unordered_map<std::string_view, size_t> position;
  for (size_t i = 0; i < fps.size(); ++i) position.emplace(fps[i]->document_id, i);

  std::vector<std::set<size_t>> partners(fps.size());
  auto link = [&](size_t i, size_t j) {
    if (i == j) return;
    partners[std::min(i, j)].insert(std::max(i, j));
  };

  std::lock_guard<std::mutex> lock(index_mu_);
  for (size_t i = 0; i < fps.size(); ++i) {
    const DocumentFingerprint& fp = *fps[i];
    const bool indexed = index_ && fp.semantic_vector &&
                         fp.semantic_vector->size() == index_->Dimension();
    if (!indexed) {
      for (size_t j = 0; j < fps.size(); ++j) link(i, j);
      continue;
    }
    // +1: the document usually finds itself.
    for (const Neighbor& n : index_->Search(*fp.semantic_vector, opt_.candidate_k + 1)) {
      auto it = position.find(n.document_id);
      if (it != position.end()) link(i, it->second);
    }
  }

  std::map<std::string_view, std::vector<size_t>> by_content;
  for (size_t i = 0; i < fps.size(); ++i) {
    if (!fps[i]->content_hash.empty()) by_content[fps[i]->content_hash].push_back(i);
  }
  for (const auto& group : by_content) {
    for (size_t a = 0; a < group.second.size(); ++a) {
      for (size_t b = a + 1; b < group.second.size(); ++b) link(group.second[a], group.second[b]);
    }
  }

  std::vector<std::vector<size_t>> rows(fps.size());
  for (size_t i = 0; i < fps.size(); ++i) rows[i].assign(partners[i].begin(), partners[i].end());
  return rows;
}

// ---------------------------------------------------------------------------
// Comparison
// ---------------------------------------------------------------------------

std::optional<DuplicateMatch> Detector::ComparePair(const FingerprintPtr& a,
                                                    const FingerprintPtr& b,
                                                    double min_score,
                                                    uint64_t timestamp_us) {
  double cached = 0.0;
  const ComparisonCache::LookupResult lookup = cache_->Lookup(*a, *b, &cached);
  switch (lookup) {
    case ComparisonCache::LookupResult::kHit:
      cache_hits_total_.fetch_add(1, std::memory_order_relaxed);
      EmitCounter(opt_, "verity.cache.hit_total");
      if (cached < min_score) return std::nullopt;
      break;
    case ComparisonCache::LookupResult::kStale:
      cache_stale_total_.fetch_add(1, std::memory_order_relaxed);
      EmitCounter(opt_, "verity.cache.stale_total");
      break;
    case ComparisonCache::LookupResult::kMiss:
      EmitCounter(opt_, "verity.cache.miss_total");
      break;
  }

  comparisons_total_.fetch_add(1, std::memory_order_relaxed);
  EmitCounter(opt_, "verity.compare.calls");
  const SimilarityBreakdown scores = Comparator::Score(*a, *b);
  cache_->Store(*a, *b, scores.fused);

  bool confirmed = false;
  if (lookup == ComparisonCache::LookupResult::kHit) {
    if (std::fabs(scores.fused - cached) > kScoreEpsilon) {
      LOG_WARN << "cached score " << cached << " for (" << a->document_id << ", "
               << b->document_id << ") disagrees with recomputed " << scores.fused
               << "; replacing";
      cache_stale_total_.fetch_add(1, std::memory_order_relaxed);
      EmitCounter(opt_, "verity.cache.stale_total");
    } else {
      confirmed = true;
    }
  }

  std::optional<DuplicateMatch> match = Comparator::FromBreakdown(*a, *b, scores, timestamp_us);
  if (!match) {
    EmitCounter(opt_, "verity.compare.below_floor_total");
    return std::nullopt;
  }
  if (match->duplicate_type == DuplicateType::kExact) {
    EmitCounter(opt_, "verity.compare.exact_total");
  }
  if (match->similarity_score < min_score) return std::nullopt;
  match->details.cached = confirmed;
  return match;
}

rocksdb::Status Detector::Compare(std::string_view id1, std::string_view id2,
                                  std::optional<DuplicateMatch>* out) {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  FingerprintPtr a = registry_->Get(id1);
  if (!a) return rocksdb::Status::NotFound("no fingerprint for " + std::string(id1));
  FingerprintPtr b = registry_->Get(id2);
  if (!b) return rocksdb::Status::NotFound("no fingerprint for " + std::string(id2));

  *out = ComparePair(a, b, ClassificationThresholds::kReportingFloor,
                     internal::WallClockMicros());
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::FindDuplicates(std::string_view document_id,
                                         const std::vector<std::string>* targets,
                                         std::vector<DuplicateMatch>* out,
                                         const RunControl& ctl) {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  OpScope op(opt_, "verity.find", "verity.FindDuplicates");

  FingerprintPtr source = registry_->Get(document_id);
  if (!source) {
    return op.Finish(rocksdb::Status::NotFound("no fingerprint for " + std::string(document_id)));
  }

  std::vector<FingerprintPtr> candidates;
  if (targets) {
    std::set<std::string_view> seen;
    for (const std::string& id : *targets) {
      if (id == source->document_id || !seen.insert(id).second) continue;
      FingerprintPtr fp = registry_->Get(id);
      if (!fp) return op.Finish(rocksdb::Status::NotFound("no fingerprint for " + id));
      candidates.push_back(std::move(fp));
    }
  } else {
    for (FingerprintPtr& fp : registry_->Snapshot()) {
      if (fp->document_id != source->document_id) candidates.push_back(std::move(fp));
    }
  }
  SpanAttr(op.span(), "targets", static_cast<uint64_t>(candidates.size()));

  const uint64_t now_us = internal::WallClockMicros();
  std::vector<DuplicateMatch> matches;
  for (const FingerprintPtr& target : candidates) {
    rocksdb::Status s = ctl.Check();
    if (!s.ok()) return op.Finish(s);
    std::optional<DuplicateMatch> m =
        ComparePair(source, target, opt_.similarity_threshold, now_us);
    if (m) matches.push_back(std::move(*m));
  }

  SortMatches(&matches);
  SpanAttr(op.span(), "matches", static_cast<uint64_t>(matches.size()));
  *out = std::move(matches);
  return op.Finish(rocksdb::Status::OK());
}

rocksdb::Status Detector::ResolveIds(const std::vector<std::string>* document_ids,
                                     std::vector<FingerprintPtr>* out) const {
  if (!document_ids) {
    *out = registry_->Snapshot();
    return rocksdb::Status::OK();
  }

  std::set<std::string> unique(document_ids->begin(), document_ids->end());
  out->clear();
  out->reserve(unique.size());
  for (const std::string& id : unique) {
    FingerprintPtr fp = registry_->Get(id);
    if (!fp) return rocksdb::Status::NotFound("no fingerprint for " + id);
    out->push_back(std::move(fp));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::SweepPairs(const std::vector<FingerprintPtr>& fps,
                                     std::vector<DuplicateMatch>* out,
                                     const RunControl& ctl) {
  const auto rows = CandidateRows(fps);
  const uint64_t now_us = internal::WallClockMicros();
  const size_t n = fps.size();

  std::atomic<uint64_t> pairs{0};
  std::atomic<size_t> next_row{0};
  std::atomic<bool> stop{false};
  std::mutex failure_mu;
  rocksdb::Status failure;

  auto worker = [&](std::vector<DuplicateMatch>* sink) {
    for (;;) {
      if (stop.load(std::memory_order_relaxed)) return;
      const size_t i = next_row.fetch_add(1, std::memory_order_relaxed);
      if (i >= n) return;

      rocksdb::Status s = ctl.Check();
      if (!s.ok()) {
        std::lock_guard<std::mutex> lock(failure_mu);
        if (failure.ok()) failure = s;
        stop.store(true, std::memory_order_relaxed);
        return;
      }

      auto compare = [&](size_t j) {
        pairs.fetch_add(1, std::memory_order_relaxed);
        std::optional<DuplicateMatch> m =
            ComparePair(fps[i], fps[j], opt_.similarity_threshold, now_us);
        if (m) sink->push_back(std::move(*m));
      };
      if (rows) {
        for (size_t j : (*rows)[i]) compare(j);
      } else {
        for (size_t j = i + 1; j < n; ++j) compare(j);
      }
    }
  };

  size_t threads = opt_.comparison_threads > 0
                       ? static_cast<size_t>(opt_.comparison_threads)
                       : std::max<size_t>(1, std::thread::hardware_concurrency());
  threads = std::max<size_t>(1, std::min(threads, n));

  std::vector<std::vector<DuplicateMatch>> partial(threads);
  if (threads == 1) {
    worker(&partial[0]);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker, &partial[t]);
    for (std::thread& th : pool) th.join();
  }

  EmitCounter(opt_, "verity.batch.pairs_total", pairs.load());
  if (!failure.ok()) return failure;

  std::vector<DuplicateMatch> matches;
  for (auto& part : partial) {
    std::move(part.begin(), part.end(), std::back_inserter(matches));
  }
  SortMatches(&matches);
  *out = std::move(matches);
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::BatchDetectDuplicates(const std::vector<std::string>* document_ids,
                                                std::vector<DuplicateMatch>* out,
                                                const RunControl& ctl) {
  if (closed_) return rocksdb::Status::InvalidArgument("detector is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  OpScope op(opt_, "verity.batch", "verity.BatchDetectDuplicates");

  std::vector<FingerprintPtr> fps;
  rocksdb::Status s = ResolveIds(document_ids, &fps);
  if (!s.ok()) return op.Finish(s);
  SpanAttr(op.span(), "documents", static_cast<uint64_t>(fps.size()));

  s = SweepPairs(fps, out, ctl);
  if (s.ok()) {
    EmitCounter(opt_, "verity.batch.matches_total", out->size());
  } else {
    LOG_WARN << "batch detection over " << fps.size() << " documents stopped: " << s.ToString();
  }
  return op.Finish(s);
}

rocksdb::Status Detector::GetDuplicateClusters(const std::vector<std::string>* document_ids,
                                               std::vector<Cluster>* out,
                                               const RunControl& ctl) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::vector<DuplicateMatch> matches;
  rocksdb::Status s = BatchDetectDuplicates(document_ids, &matches, ctl);
  if (!s.ok()) return s;

  *out = BuildClusters(matches);
  EmitCounter(opt_, "verity.clusters.calls");
  EmitHistogram(opt_, "verity.clusters.count", out->size());
  return rocksdb::Status::OK();
}

rocksdb::Status Detector::RemoveDuplicates(const std::vector<std::string>* document_ids,
                                           KeepStrategy strategy,
                                           std::vector<std::string>* keep,
                                           std::vector<DedupDecision>* decisions,
                                           const RunControl& ctl) {
  if (!keep) return rocksdb::Status::InvalidArgument("keep is null");

  std::vector<Cluster> clusters;
  rocksdb::Status s = GetDuplicateClusters(document_ids, &clusters, ctl);
  if (!s.ok()) return s;

  // Members come from the snapshot the clusters were built on; look them up
  // again so a concurrent removal surfaces as NotFound.
  std::vector<DedupDecision> resolved;
  s = ResolveClusters(
      clusters, [this](const std::string& id) { return registry_->Get(id); }, strategy,
      &resolved);
  if (!s.ok()) return s;

  std::vector<std::string> ids;
  if (document_ids) {
    ids = *document_ids;
  } else {
    for (const FingerprintPtr& fp : registry_->Snapshot()) ids.push_back(fp->document_id);
  }

  uint64_t dropped = 0;
  for (const DedupDecision& d : resolved) dropped += d.dropped.size();
  EmitCounter(opt_, "verity.dedup.dropped_total", dropped);
  LOG_DEBUG << "dedup (" << KeepStrategyName(strategy) << "): " << resolved.size()
            << " clusters, " << dropped << " dropped";

  *keep = KeepList(ids, resolved);
  if (decisions) *decisions = std::move(resolved);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

Statistics Detector::GetStatistics() const {
  Statistics stats;
  stats.similarity_threshold = opt_.similarity_threshold;
  stats.cached_comparisons = cache_->Size();
  stats.tfidf_vocabulary_size = vectorizer_->VocabularySize();
  stats.comparisons_total = comparisons_total_.load();
  stats.cache_hits_total = cache_hits_total_.load();
  stats.cache_stale_total = cache_stale_total_.load();

  for (const FingerprintPtr& fp : registry_->Snapshot()) {
    ++stats.total_documents;
    stats.fingerprint_creation_times[fp->document_id] = fp->created_at_us;
    if (fp->semantic_vector) ++stats.semantic_vectors;
    if (fp->visual_hash) ++stats.visual_hashes;
  }
  return stats;
}

void Detector::ClearCache() {
  const size_t evicted = cache_->Size();
  cache_->Clear();
  EmitCounter(opt_, "verity.cache.evicted_total", evicted);
  LOG_INFO << "comparison cache cleared (" << evicted << " entries)";
}

}  // namespace verity
