#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/status.h>

#include <verity/types.hpp>

namespace verity {

namespace internal {

/**
 * Versioned little-endian encoding of a fingerprint. The revision is not
 * encoded; it belongs to the process that built or loaded the fingerprint.
 */
std::string EncodeFingerprint(const DocumentFingerprint& fp);

/** False on truncated, trailing or unknown-version input. */
bool DecodeFingerprint(std::string_view bytes, DocumentFingerprint* out);

}  // namespace internal

/** RocksDB knobs for the fingerprint store. */
struct StoreOptions {
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;
  bool sync_writes = false;
};

/**
 * Durable copy of the fingerprint registry.
 *
 * Column families:
 * - verity_fingerprints: document_id -> encoded fingerprint
 * - verity_meta: reserved keys (the fitted TF-IDF vocabulary)
 */
class FingerprintStore {
 public:
  ~FingerprintStore();

  FingerprintStore(const FingerprintStore&) = delete;
  FingerprintStore& operator=(const FingerprintStore&) = delete;

  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<FingerprintStore>* out,
                              const StoreOptions& opt = StoreOptions{});

  rocksdb::Status Put(const DocumentFingerprint& fp);
  rocksdb::Status Delete(std::string_view document_id);

  /**
   * Decode every stored fingerprint, in key order. Undecodable records are
   * skipped and counted in *skipped (may be null).
   */
  rocksdb::Status LoadAll(std::vector<std::shared_ptr<DocumentFingerprint>>* out,
                          uint64_t* skipped = nullptr) const;

  rocksdb::Status PutVocabulary(std::string_view encoded);

  /** NotFound when no vocabulary was ever stored. */
  rocksdb::Status GetVocabulary(std::string* encoded) const;

  /** Release RocksDB resources. Safe to call multiple times. */
  void Close();

 private:
  explicit FingerprintStore(const StoreOptions& opt);

  StoreOptions opt_;
  rocksdb::DB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  std::shared_ptr<rocksdb::Cache> block_cache_;

  rocksdb::ColumnFamilyHandle* fingerprints_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* meta_cf_ = nullptr;
};

}  // namespace verity
