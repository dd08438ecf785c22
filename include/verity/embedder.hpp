#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace verity {

// Result of embedding computation
struct EmbeddingResult {
  std::vector<float> embedding;  // L2-normalised
  bool success = false;
  std::string error_message;
};

// Supported ONNX model families
enum class EmbedderModelType {
  kMiniLM,    // all-MiniLM-L6-v2 (384 dimensions)
  kBGESmall,  // BGE-small-en-v1.5 (384 dimensions)
  kBGELarge   // BGE-large-en-v1.5 (1024 dimensions)
};

/**
 * Text embedding collaborator.
 *
 * Implementations must be safe to call from several threads at once. A call
 * may be abandoned by the caller after its timeout, so an implementation
 * must not rely on the caller staying alive.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  /**
   * Load an ONNX sentence encoder. vocab.txt is expected beside the model.
   * num_threads: 0 = ONNX Runtime default, >0 = intra-op threads.
   * Returns nullptr on failure (or when built without VERITY_ENABLE_SEMANTIC)
   * and sets error_out if provided.
   */
  static std::unique_ptr<Embedder> CreateOnnx(const std::string& model_path,
                                              EmbedderModelType type,
                                              int num_threads = 0,
                                              std::string* error_out = nullptr);

  // Input is UTF-8 text, already truncated by the caller.
  virtual EmbeddingResult Embed(std::string_view text) const = 0;

  virtual size_t Dimension() const = 0;
};

// Result of perceptual hashing
struct ImageHashResult {
  std::string hash;  // hex
  bool success = false;
  std::string error_message;
};

/**
 * Perceptual image hash collaborator (page rendering is out of scope; the
 * caller supplies an adapter). Same threading contract as Embedder.
 */
class ImageHasher {
 public:
  virtual ~ImageHasher() = default;

  virtual ImageHashResult PerceptualHash(std::string_view image_ref) const = 0;
};

}  // namespace verity
