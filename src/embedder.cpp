#include <verity/embedder.hpp>

#ifdef VERITY_ENABLE_SEMANTIC

#include <verity/tokenizer.hpp>

#include <onnxruntime_cxx_api.h>

#include <cmath>
#include <fstream>

namespace verity {

namespace internal {

class OnnxEmbedder : public Embedder {
 public:
  OnnxEmbedder(EmbedderModelType type, size_t dimension)
      : model_type_(type),
        dimension_(dimension),
        env_(ORT_LOGGING_LEVEL_WARNING, "verity_embedder"),
        memory_info_(Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                OrtMemType::OrtMemTypeDefault)) {}

  bool Initialize(const std::string& model_path, const std::string& vocab_path,
                  int num_threads, std::string* error_out) {
    tokenizer_ = WordPieceTokenizer::Load(vocab_path, error_out);
    if (!tokenizer_) return false;

    try {
      Ort::SessionOptions so;
      if (num_threads > 0) so.SetIntraOpNumThreads(num_threads);
      so.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
      session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), so);

      Ort::AllocatorWithDefaultOptions allocator;
      for (size_t i = 0; i < session_->GetInputCount(); ++i) {
        input_names_.emplace_back(session_->GetInputNameAllocated(i, allocator).get());
      }
      output_name_ = session_->GetOutputNameAllocated(0, allocator).get();
      return true;
    } catch (const Ort::Exception& e) {
      if (error_out) *error_out = e.what();
      return false;
    }
  }

  EmbeddingResult Embed(std::string_view text) const override {
    EmbeddingResult result;
    try {
      std::string prefixed;
      if (model_type_ != EmbedderModelType::kMiniLM) {
        // BGE retrieval instruction.
        prefixed = "Represent this sentence for searching relevant passages: ";
        prefixed.append(text.data(), text.size());
        text = prefixed;
      }

      TokenizedInput tokens = tokenizer_->Encode(text, 512);
      const std::vector<int64_t> shape = {1, static_cast<int64_t>(tokens.input_ids.size())};

      std::vector<Ort::Value> inputs;
      std::vector<const char*> names;
      for (const std::string& name : input_names_) {
        std::vector<int64_t>* data = nullptr;
        if (name == "input_ids") data = &tokens.input_ids;
        else if (name == "attention_mask") data = &tokens.attention_mask;
        else if (name == "token_type_ids") data = &tokens.token_type_ids;
        if (!data) {
          result.error_message = "unsupported model input " + name;
          return result;
        }
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info_, data->data(),
                                                           data->size(), shape.data(),
                                                           shape.size()));
        names.push_back(name.c_str());
      }

      const char* output_names[] = {output_name_.c_str()};
      auto outputs = session_->Run(Ort::RunOptions{nullptr}, names.data(), inputs.data(),
                                   inputs.size(), output_names, 1);
      if (outputs.empty()) {
        result.error_message = "model produced no output";
        return result;
      }

      auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
      const float* data = outputs[0].GetTensorData<float>();
      if (out_shape.size() == 3) {
        // Mean pooling over the (unpadded) sequence.
        const int64_t seq = out_shape[1];
        const int64_t hidden = out_shape[2];
        result.embedding.assign(static_cast<size_t>(hidden), 0.0f);
        for (int64_t t = 0; t < seq; ++t) {
          for (int64_t h = 0; h < hidden; ++h) result.embedding[h] += data[t * hidden + h];
        }
        for (float& v : result.embedding) v /= static_cast<float>(seq);
      } else if (out_shape.size() == 2) {
        result.embedding.assign(data, data + out_shape[1]);
      } else {
        result.error_message = "unexpected output rank";
        return result;
      }

      double norm = 0.0;
      for (float v : result.embedding) norm += static_cast<double>(v) * v;
      norm = std::sqrt(norm);
      if (norm > 1e-12) {
        for (float& v : result.embedding) v = static_cast<float>(v / norm);
      }
      result.success = true;
    } catch (const Ort::Exception& e) {
      result.error_message = e.what();
    }
    return result;
  }

  size_t Dimension() const override { return dimension_; }

 private:
  EmbedderModelType model_type_;
  size_t dimension_;
  std::unique_ptr<WordPieceTokenizer> tokenizer_;

  Ort::Env env_;
  Ort::MemoryInfo memory_info_;
  std::unique_ptr<Ort::Session> session_;
  std::vector<std::string> input_names_;
  std::string output_name_;
};

}  // namespace internal

std::unique_ptr<Embedder> Embedder::CreateOnnx(const std::string& model_path,
                                               EmbedderModelType type,
                                               int num_threads,
                                               std::string* error_out) {
  const size_t slash = model_path.find_last_of('/');
  const std::string vocab_path =
      (slash == std::string::npos ? std::string() : model_path.substr(0, slash + 1)) + "vocab.txt";
  if (!std::ifstream(vocab_path).good()) {
    if (error_out) *error_out = "vocab.txt not found next to " + model_path;
    return nullptr;
  }

  const size_t dimension = type == EmbedderModelType::kBGELarge ? 1024 : 384;
  auto embedder = std::make_unique<internal::OnnxEmbedder>(type, dimension);
  if (!embedder->Initialize(model_path, vocab_path, num_threads, error_out)) return nullptr;
  return embedder;
}

}  // namespace verity

#else  // !VERITY_ENABLE_SEMANTIC

namespace verity {

std::unique_ptr<Embedder> Embedder::CreateOnnx(const std::string& /*model_path*/,
                                               EmbedderModelType /*type*/,
                                               int /*num_threads*/,
                                               std::string* error_out) {
  if (error_out) {
    *error_out = "ONNX embedder not built. Rebuild with VERITY_ENABLE_SEMANTIC=ON";
  }
  return nullptr;
}

}  // namespace verity

#endif  // VERITY_ENABLE_SEMANTIC
