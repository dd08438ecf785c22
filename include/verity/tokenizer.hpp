#pragma once

#ifdef VERITY_ENABLE_SEMANTIC

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace verity::internal {

/** Model inputs for one sequence: [CLS] pieces... [SEP]. */
struct TokenizedInput {
  std::vector<int64_t> input_ids;
  std::vector<int64_t> attention_mask;
  std::vector<int64_t> token_type_ids;
};

/**
 * Uncased WordPiece tokenizer for BERT-family encoders.
 *
 * Loads vocab.txt (one piece per line, line number = id). Text is
 * lower-cased, split on whitespace, punctuation becomes its own token and
 * CJK ideographs are isolated; each word is then split greedily into the
 * longest vocabulary pieces, continuation pieces prefixed with "##".
 */
class WordPieceTokenizer {
 public:
  static std::unique_ptr<WordPieceTokenizer> Load(const std::string& vocab_path,
                                                  std::string* error_out = nullptr);

  /** Encode text, truncating to `max_length` ids including [CLS] and [SEP]. */
  TokenizedInput Encode(std::string_view text, size_t max_length = 512) const;

  size_t VocabSize() const { return vocab_.size(); }

 private:
  WordPieceTokenizer() = default;

  std::vector<std::string> SplitWords(std::string_view text) const;
  void AppendPieces(const std::string& word, std::vector<int64_t>* ids) const;
  int64_t IdOf(std::string_view piece, int64_t fallback) const;

  std::unordered_map<std::string, int64_t> vocab_;
  int64_t unk_id_ = 100;
  int64_t cls_id_ = 101;
  int64_t sep_id_ = 102;

  static constexpr size_t kMaxWordBytes = 200;
};

}  // namespace verity::internal

#endif  // VERITY_ENABLE_SEMANTIC
