#pragma once
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace verity::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock timestamp (microseconds since epoch). Fingerprint creation times
// use this so they survive a restart through the fingerprint store.
inline uint64_t WallClockMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

// Message digest through OpenSSL's EVP API, rendered as lower-case hex.
// Returns an empty string if OpenSSL fails to produce a digest.
inline std::string HexDigest(const EVP_MD* md, std::string_view data) {
  std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  bool ok = false;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (ctx) {
    ok = EVP_DigestInit_ex(ctx, md, nullptr) &&
         EVP_DigestUpdate(ctx, data.data(), data.size()) &&
         EVP_DigestFinal_ex(ctx, out.data(), &len);
    EVP_MD_CTX_free(ctx);
  }
  if (!ok) return std::string();

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    hex.push_back(kHex[out[i] >> 4]);
    hex.push_back(kHex[out[i] & 0x0f]);
  }
  return hex;
}

inline std::string Md5Hex(std::string_view data) { return HexDigest(EVP_md5(), data); }
inline std::string Sha256Hex(std::string_view data) { return HexDigest(EVP_sha256(), data); }

// ---------------------------------------------------------------------------
// Little-endian encoding helpers for the fingerprint store
// ---------------------------------------------------------------------------

inline void PutU32LE(std::string* dst, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    dst->push_back(static_cast<char>(v & 0xffu));
    v >>= 8;
  }
}

inline void PutU64LE(std::string* dst, uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    dst->push_back(static_cast<char>(v & 0xffu));
    v >>= 8;
  }
}

inline std::string EncodeU64LE(uint64_t v) {
  std::string s;
  s.reserve(8);
  PutU64LE(&s, v);
  return s;
}

inline bool DecodeU64LE(std::string_view s, uint64_t* out) {
  if (s.size() != 8) return false;
  uint64_t v = 0;
  // little endian decode
  for (int i = 7; i >= 0; --i) {
    v <<= 8;
    v |= static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

inline void PutF64LE(std::string* dst, double d) {
  uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof(bits));
  PutU64LE(dst, bits);
}

inline void PutF32LE(std::string* dst, float f) {
  uint32_t bits = 0;
  std::memcpy(&bits, &f, sizeof(bits));
  PutU32LE(dst, bits);
}

// Length-prefixed (u32) byte string.
inline void PutBytes(std::string* dst, std::string_view bytes) {
  PutU32LE(dst, static_cast<uint32_t>(bytes.size()));
  dst->append(bytes.data(), bytes.size());
}

// Sequential reader over an encoded buffer. Every Get* returns false once the
// input is exhausted; callers map that to Corruption.
class ByteReader {
 public:
  explicit ByteReader(std::string_view data) : data_(data) {}

  bool GetU8(uint8_t* out) {
    if (data_.empty()) return false;
    *out = static_cast<uint8_t>(data_[0]);
    data_.remove_prefix(1);
    return true;
  }

  bool GetU32(uint32_t* out) {
    if (data_.size() < 4) return false;
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
      v <<= 8;
      v |= static_cast<uint8_t>(data_[static_cast<size_t>(i)]);
    }
    data_.remove_prefix(4);
    *out = v;
    return true;
  }

  bool GetU64(uint64_t* out) {
    if (data_.size() < 8) return false;
    if (!DecodeU64LE(data_.substr(0, 8), out)) return false;
    data_.remove_prefix(8);
    return true;
  }

  bool GetF32(float* out) {
    uint32_t bits = 0;
    if (!GetU32(&bits)) return false;
    std::memcpy(out, &bits, sizeof(bits));
    return true;
  }

  bool GetF64(double* out) {
    uint64_t bits = 0;
    if (!GetU64(&bits)) return false;
    std::memcpy(out, &bits, sizeof(bits));
    return true;
  }

  bool GetBytes(std::string* out) {
    uint32_t len = 0;
    if (!GetU32(&len) || data_.size() < len) return false;
    out->assign(data_.data(), len);
    data_.remove_prefix(len);
    return true;
  }

  bool AtEnd() const { return data_.empty(); }

 private:
  std::string_view data_;
};

// ---------------------------------------------------------------------------
// Vector similarity
// ---------------------------------------------------------------------------

// Cosine similarity of two dense vectors, accumulated in double.
// Returns 0.0 on dimension mismatch, empty input or a zero vector.
inline double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0;

  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-12) return 0.0;
  return dot / denom;
}

// hnswlib's L2 space reports squared distances. For unit vectors
// |a-b|^2 = 2 - 2cos(a,b).
inline float SquaredL2ToCosine(float squared_l2) {
  return 1.0f - squared_l2 / 2.0f;
}

}  // namespace verity::internal
