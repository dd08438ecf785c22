#include <verity/tokenizer.hpp>

#ifdef VERITY_ENABLE_SEMANTIC

#include <fstream>

#include <verity/normalize.hpp>

namespace verity::internal {

namespace {

bool IsAsciiPunct(unsigned char c) {
  return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) ||
         (c >= 123 && c <= 126);
}

// Decodes the code point starting at text[i]; *len receives its byte length.
uint32_t DecodeAt(std::string_view text, size_t i, size_t* len) {
  const auto b0 = static_cast<unsigned char>(text[i]);
  size_t n = b0 < 0x80 ? 1 : (b0 & 0xE0) == 0xC0 ? 2 : (b0 & 0xF0) == 0xE0 ? 3
           : (b0 & 0xF8) == 0xF0 ? 4 : 1;
  if (i + n > text.size()) n = 1;
  *len = n;
  if (n == 1) return b0;
  uint32_t cp = b0 & (0x7F >> n);
  for (size_t k = 1; k < n; ++k) cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
  return cp;
}

bool IsCjkIdeograph(uint32_t cp) {
  return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
         (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0x20000 && cp <= 0x2FA1F);
}

}  // namespace

std::unique_ptr<WordPieceTokenizer> WordPieceTokenizer::Load(const std::string& vocab_path,
                                                             std::string* error_out) {
  std::ifstream in(vocab_path);
  if (!in) {
    if (error_out) *error_out = "cannot open vocabulary " + vocab_path;
    return nullptr;
  }

  std::unique_ptr<WordPieceTokenizer> tok(new WordPieceTokenizer());
  std::string line;
  int64_t id = 0;
  while (std::getline(in, line)) {
    while (!line.empty() && IsAsciiSpace(static_cast<unsigned char>(line.back()))) line.pop_back();
    tok->vocab_.emplace(line, id++);
  }
  if (tok->vocab_.empty()) {
    if (error_out) *error_out = "vocabulary " + vocab_path + " is empty";
    return nullptr;
  }

  tok->unk_id_ = tok->IdOf("[UNK]", 100);
  tok->cls_id_ = tok->IdOf("[CLS]", 101);
  tok->sep_id_ = tok->IdOf("[SEP]", 102);
  return tok;
}

int64_t WordPieceTokenizer::IdOf(std::string_view piece, int64_t fallback) const {
  auto it = vocab_.find(std::string(piece));
  return it == vocab_.end() ? fallback : it->second;
}

std::vector<std::string> WordPieceTokenizer::SplitWords(std::string_view text) const {
  std::vector<std::string> words;
  std::string word;
  auto flush = [&]() {
    if (!word.empty()) words.push_back(std::move(word));
    word.clear();
  };

  size_t i = 0;
  while (i < text.size()) {
    size_t len = 1;
    const uint32_t cp = DecodeAt(text, i, &len);
    if (cp < 0x80 && IsAsciiSpace(static_cast<unsigned char>(cp))) {
      flush();
    } else if ((cp < 0x80 && IsAsciiPunct(static_cast<unsigned char>(cp))) || IsCjkIdeograph(cp)) {
      flush();
      words.emplace_back(text.substr(i, len));
    } else if (cp >= 'A' && cp <= 'Z') {
      word.push_back(static_cast<char>(cp - 'A' + 'a'));
    } else {
      word.append(text.data() + i, len);
    }
    i += len;
  }
  flush();
  return words;
}

void WordPieceTokenizer::AppendPieces(const std::string& word, std::vector<int64_t>* ids) const {
  if (word.size() > kMaxWordBytes) {
    ids->push_back(unk_id_);
    return;
  }

  std::vector<int64_t> pieces;
  size_t start = 0;
  std::string candidate;
  while (start < word.size()) {
    int64_t found = -1;
    size_t end = word.size();
    for (; end > start; --end) {
      // Never cut inside a UTF-8 sequence.
      if (end < word.size() && (static_cast<unsigned char>(word[end]) & 0xC0) == 0x80) continue;
      candidate.assign(start > 0 ? "##" : "");
      candidate.append(word, start, end - start);
      found = IdOf(candidate, -1);
      if (found >= 0) break;
    }
    if (found < 0) {
      ids->push_back(unk_id_);
      return;
    }
    pieces.push_back(found);
    start = end;
  }
  ids->insert(ids->end(), pieces.begin(), pieces.end());
}

TokenizedInput WordPieceTokenizer::Encode(std::string_view text, size_t max_length) const {
  if (max_length < 2) max_length = 2;

  std::vector<int64_t> ids;
  ids.push_back(cls_id_);
  for (const std::string& word : SplitWords(text)) {
    AppendPieces(word, &ids);
    if (ids.size() >= max_length - 1) break;
  }
  if (ids.size() > max_length - 1) ids.resize(max_length - 1);
  ids.push_back(sep_id_);

  TokenizedInput out;
  out.attention_mask.assign(ids.size(), 1);
  out.token_type_ids.assign(ids.size(), 0);
  out.input_ids = std::move(ids);
  return out;
}

}  // namespace verity::internal

#endif  // VERITY_ENABLE_SEMANTIC
