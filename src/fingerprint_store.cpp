#include <verity/fingerprint_store.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>

#include <trantor/utils/Logger.h>

#include <verity/internal.hpp>
#include <verity/version.hpp>

namespace verity {

namespace {

constexpr const char* kFingerprintsCF = "verity_fingerprints";
constexpr const char* kMetaCF = "verity_meta";
constexpr const char* kVocabularyKey = "tfidf_vocabulary";

constexpr uint8_t kFeatureFlag = 0;
constexpr uint8_t kFeatureNumber = 1;

rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

}  // namespace

namespace internal {

std::string EncodeFingerprint(const DocumentFingerprint& fp) {
  std::string out;
  out.reserve(256);
  out.push_back(static_cast<char>(kFingerprintFormatVersion));
  PutBytes(&out, fp.document_id);
  PutBytes(&out, fp.content_hash);
  PutBytes(&out, fp.fuzzy_hash);
  PutBytes(&out, fp.metadata_hash);

  PutU32LE(&out, static_cast<uint32_t>(fp.structural_features.size()));
  for (const auto& [name, value] : fp.structural_features) {
    PutBytes(&out, name);
    if (const bool* flag = std::get_if<bool>(&value)) {
      out.push_back(static_cast<char>(kFeatureFlag));
      out.push_back(static_cast<char>(*flag ? 1 : 0));
    } else {
      out.push_back(static_cast<char>(kFeatureNumber));
      PutF64LE(&out, std::get<double>(value));
    }
  }

  out.push_back(static_cast<char>(fp.tfidf_vector ? 1 : 0));
  if (fp.tfidf_vector) {
    const SparseVector& v = *fp.tfidf_vector;
    PutU64LE(&out, v.vocabulary_id);
    PutU32LE(&out, static_cast<uint32_t>(v.indices.size()));
    for (size_t i = 0; i < v.indices.size(); ++i) {
      PutU32LE(&out, v.indices[i]);
      PutF32LE(&out, v.values[i]);
    }
  }

  out.push_back(static_cast<char>(fp.semantic_vector ? 1 : 0));
  if (fp.semantic_vector) {
    PutU32LE(&out, static_cast<uint32_t>(fp.semantic_vector->size()));
    for (float f : *fp.semantic_vector) PutF32LE(&out, f);
  }

  out.push_back(static_cast<char>(fp.visual_hash ? 1 : 0));
  if (fp.visual_hash) PutBytes(&out, *fp.visual_hash);

  PutU64LE(&out, fp.word_count);
  PutU64LE(&out, fp.char_count);
  PutU64LE(&out, fp.page_count);
  PutU64LE(&out, fp.created_at_us);
  return out;
}

bool DecodeFingerprint(std::string_view bytes, DocumentFingerprint* out) {
  if (!out) return false;
  ByteReader in(bytes);
  DocumentFingerprint fp;

  uint8_t version = 0;
  if (!in.GetU8(&version) || version != kFingerprintFormatVersion) return false;
  if (!in.GetBytes(&fp.document_id) || !in.GetBytes(&fp.content_hash) ||
      !in.GetBytes(&fp.fuzzy_hash) || !in.GetBytes(&fp.metadata_hash)) {
    return false;
  }

  uint32_t feature_count = 0;
  if (!in.GetU32(&feature_count)) return false;
  for (uint32_t i = 0; i < feature_count; ++i) {
    std::string name;
    uint8_t tag = 0;
    if (!in.GetBytes(&name) || !in.GetU8(&tag)) return false;
    if (tag == kFeatureFlag) {
      uint8_t flag = 0;
      if (!in.GetU8(&flag) || flag > 1) return false;
      fp.structural_features[name] = flag == 1;
    } else if (tag == kFeatureNumber) {
      double number = 0.0;
      if (!in.GetF64(&number)) return false;
      fp.structural_features[name] = number;
    } else {
      return false;
    }
  }

  uint8_t present = 0;
  if (!in.GetU8(&present) || present > 1) return false;
  if (present) {
    SparseVector v;
    uint32_t nnz = 0;
    if (!in.GetU64(&v.vocabulary_id) || !in.GetU32(&nnz)) return false;
    // Each entry takes 8 bytes; reject counts the input cannot hold.
    if (static_cast<uint64_t>(nnz) * 8 > bytes.size()) return false;
    v.indices.resize(nnz);
    v.values.resize(nnz);
    for (uint32_t i = 0; i < nnz; ++i) {
      if (!in.GetU32(&v.indices[i]) || !in.GetF32(&v.values[i])) return false;
      if (i > 0 && v.indices[i] <= v.indices[i - 1]) return false;
    }
    fp.tfidf_vector = std::move(v);
  }

  if (!in.GetU8(&present) || present > 1) return false;
  if (present) {
    uint32_t dim = 0;
    if (!in.GetU32(&dim)) return false;
    if (static_cast<uint64_t>(dim) * 4 > bytes.size()) return false;
    std::vector<float> vec(dim);
    for (uint32_t i = 0; i < dim; ++i) {
      if (!in.GetF32(&vec[i])) return false;
    }
    fp.semantic_vector = std::move(vec);
  }

  if (!in.GetU8(&present) || present > 1) return false;
  if (present) {
    std::string hash;
    if (!in.GetBytes(&hash)) return false;
    fp.visual_hash = std::move(hash);
  }

  if (!in.GetU64(&fp.word_count) || !in.GetU64(&fp.char_count) ||
      !in.GetU64(&fp.page_count) || !in.GetU64(&fp.created_at_us)) {
    return false;
  }
  if (!in.AtEnd()) return false;

  *out = std::move(fp);
  return true;
}

}  // namespace internal

FingerprintStore::FingerprintStore(const StoreOptions& opt) : opt_(opt) {}

FingerprintStore::~FingerprintStore() { Close(); }

rocksdb::Status FingerprintStore::Open(const std::string& db_path,
                                       std::unique_ptr<FingerprintStore>* out,
                                       const StoreOptions& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (db_path.empty()) return rocksdb::Status::InvalidArgument("db_path is empty");

  auto store = std::unique_ptr<FingerprintStore>(new FingerprintStore(opt));

  rocksdb::DBOptions options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  store->block_cache_ = cache;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName,
                   MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kFingerprintsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kMetaCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::DB* db = nullptr;
  rocksdb::Status s = rocksdb::DB::Open(options, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->fingerprints_cf_ = store->handles_[1];
  store->meta_cf_ = store->handles_[2];

  *out = std::move(store);
  return rocksdb::Status::OK();
}

void FingerprintStore::Close() {
  if (!db_) return;
  for (auto* h : handles_) {
    rocksdb::Status s = db_->DestroyColumnFamilyHandle(h);
    if (!s.ok()) LOG_ERROR << "destroying column family handle: " << s.ToString();
  }
  handles_.clear();
  fingerprints_cf_ = nullptr;
  meta_cf_ = nullptr;
  delete db_;
  db_ = nullptr;
}

rocksdb::Status FingerprintStore::Put(const DocumentFingerprint& fp) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (fp.document_id.empty()) return rocksdb::Status::InvalidArgument("document_id is empty");

  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;
  return db_->Put(wo, fingerprints_cf_, rocksdb::Slice(fp.document_id),
                  internal::EncodeFingerprint(fp));
}

rocksdb::Status FingerprintStore::Delete(std::string_view document_id) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;
  return db_->Delete(wo, fingerprints_cf_,
                     rocksdb::Slice(document_id.data(), document_id.size()));
}

rocksdb::Status FingerprintStore::LoadAll(std::vector<std::shared_ptr<DocumentFingerprint>>* out,
                                          uint64_t* skipped) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();
  uint64_t bad = 0;

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), fingerprints_cf_));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    auto fp = std::make_shared<DocumentFingerprint>();
    const rocksdb::Slice value = it->value();
    if (!internal::DecodeFingerprint(std::string_view(value.data(), value.size()), fp.get()) ||
        fp->document_id != it->key().ToString()) {
      LOG_WARN << "skipping undecodable fingerprint record " << it->key().ToString();
      ++bad;
      continue;
    }
    out->push_back(std::move(fp));
  }
  if (skipped) *skipped = bad;
  return it->status();
}

rocksdb::Status FingerprintStore::PutVocabulary(std::string_view encoded) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;
  return db_->Put(wo, meta_cf_, rocksdb::Slice(kVocabularyKey),
                  rocksdb::Slice(encoded.data(), encoded.size()));
}

rocksdb::Status FingerprintStore::GetVocabulary(std::string* encoded) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!encoded) return rocksdb::Status::InvalidArgument("encoded is null");
  return db_->Get(rocksdb::ReadOptions(), meta_cf_, rocksdb::Slice(kVocabularyKey), encoded);
}

}  // namespace verity
