#include <verity/tfidf.hpp>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_set>

#include <verity/internal.hpp>
#include <verity/normalize.hpp>

namespace verity {

namespace {

constexpr uint8_t kVocabularyFormat = 1;

// The 318-word English list used by scikit-learn's stop_words="english".
const std::unordered_set<std::string_view>& EnglishStopWords() {
  static const std::unordered_set<std::string_view> kWords = {
      "a", "about", "above", "across", "after", "afterwards", "again", "against",
      "all", "almost", "alone", "along", "already", "also", "although", "always",
      "am", "among", "amongst", "amoungst", "amount", "an", "and", "another", "any",
      "anyhow", "anyone", "anything", "anyway", "anywhere", "are", "around", "as",
      "at", "back", "be", "became", "because", "become", "becomes", "becoming",
      "been", "before", "beforehand", "behind", "being", "below", "beside", "besides",
      "between", "beyond", "bill", "both", "bottom", "but", "by", "call", "can",
      "cannot", "cant", "co", "con", "could", "couldnt", "cry", "de", "describe",
      "detail", "do", "done", "down", "due", "during", "each", "eg", "eight",
      "either", "eleven", "else", "elsewhere", "empty", "enough", "etc", "even",
      "ever", "every", "everyone", "everything", "everywhere", "except", "few",
      "fifteen", "fifty", "fill", "find", "fire", "first", "five", "for", "former",
      "formerly", "forty", "found", "four", "from", "front", "full", "further", "get",
      "give", "go", "had", "has", "hasnt", "have", "he", "hence", "her", "here",
      "hereafter", "hereby", "herein", "hereupon", "hers", "herself", "him",
      "himself", "his", "how", "however", "hundred", "i", "ie", "if", "in", "inc",
      "indeed", "interest", "into", "is", "it", "its", "itself", "keep", "last",
      "latter", "latterly", "least", "less", "ltd", "made", "many", "may", "me",
      "meanwhile", "might", "mill", "mine", "more", "moreover", "most", "mostly",
      "move", "much", "must", "my", "myself", "name", "namely", "neither", "never",
      "nevertheless", "next", "nine", "no", "nobody", "none", "noone", "nor", "not",
      "nothing", "now", "nowhere", "of", "off", "often", "on", "once", "one", "only",
      "onto", "or", "other", "others", "otherwise", "our", "ours", "ourselves", "out",
      "over", "own", "part", "per", "perhaps", "please", "put", "rather", "re",
      "same", "see", "seem", "seemed", "seeming", "seems", "serious", "several",
      "she", "should", "show", "side", "since", "sincere", "six", "sixty", "so",
      "some", "somehow", "someone", "something", "sometime", "sometimes", "somewhere",
      "still", "such", "system", "take", "ten", "than", "that", "the", "their",
      "them", "themselves", "then", "thence", "there", "thereafter", "thereby",
      "therefore", "therein", "thereupon", "these", "they", "thick", "thin", "third",
      "this", "those", "though", "three", "through", "throughout", "thru", "thus",
      "to", "together", "too", "top", "toward", "towards", "twelve", "twenty", "two",
      "un", "under", "until", "up", "upon", "us", "very", "via", "was", "we", "well",
      "were", "what", "whatever", "when", "whence", "whenever", "where", "whereafter",
      "whereas", "whereby", "wherein", "whereupon", "wherever", "whether", "which",
      "while", "whither", "who", "whoever", "whole", "whom", "whose", "why", "will",
      "with", "within", "without", "would", "yet", "you", "your", "yours", "yourself",
      "yourselves"};
  return kWords;
}

}  // namespace

TfidfVectorizer::TfidfVectorizer(TfidfOptions opt) : opt_(opt) {}

std::vector<std::string> TfidfVectorizer::Analyze(std::string_view text) const {
  std::vector<std::string> tokens;
  std::string current;
  size_t current_cp = 0;
  auto flush = [&]() {
    if (current_cp >= 2 &&
        !(opt_.english_stop_words && EnglishStopWords().count(current) > 0)) {
      tokens.push_back(current);
    }
    current.clear();
    current_cp = 0;
  };
  const std::string lower = internal::Lowercase(text);
  for (char ch : lower) {
    const auto c = static_cast<unsigned char>(ch);
    if (!internal::IsWordByte(c)) {
      flush();
      continue;
    }
    current.push_back(ch);
    if ((c & 0xC0) != 0x80) ++current_cp;
  }
  flush();

  const int lo = std::max(1, opt_.ngram_min);
  const int hi = std::max(lo, opt_.ngram_max);
  std::vector<std::string> terms;
  for (int n = lo; n <= hi; ++n) {
    if (tokens.size() < static_cast<size_t>(n)) break;
    for (size_t i = 0; i + n <= tokens.size(); ++i) {
      std::string term = tokens[i];
      for (int k = 1; k < n; ++k) {
        term.push_back(' ');
        term += tokens[i + k];
      }
      terms.push_back(std::move(term));
    }
  }
  return terms;
}

rocksdb::Status TfidfVectorizer::Fit(const std::vector<std::string>& documents) {
  std::vector<std::string_view> views(documents.begin(), documents.end());
  std::unique_lock<std::shared_mutex> lock(mu_);
  return FitLocked(views);
}

rocksdb::Status TfidfVectorizer::FitIfEmpty(std::string_view document) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (vocabulary_id_ != 0) return rocksdb::Status::OK();
  return FitLocked({document});
}

rocksdb::Status TfidfVectorizer::FitLocked(const std::vector<std::string_view>& documents) {
  if (documents.empty()) return rocksdb::Status::InvalidArgument("empty corpus");

  struct TermStats {
    uint64_t total = 0;
    uint64_t df = 0;
  };
  std::unordered_map<std::string, TermStats> stats;
  for (std::string_view doc : documents) {
    std::unordered_set<std::string> seen;
    for (std::string& term : Analyze(doc)) {
      TermStats& st = stats[term];
      ++st.total;
      if (seen.insert(std::move(term)).second) ++st.df;
    }
  }
  if (stats.empty()) {
    return rocksdb::Status::InvalidArgument("empty vocabulary; corpus has only stop words");
  }

  std::vector<std::pair<std::string, TermStats>> ranked(stats.begin(), stats.end());
  if (opt_.max_features > 0 && ranked.size() > opt_.max_features) {
    // Most frequent terms win; ties alphabetical.
    std::partial_sort(ranked.begin(), ranked.begin() + opt_.max_features, ranked.end(),
                      [](const auto& a, const auto& b) {
                        if (a.second.total != b.second.total) return a.second.total > b.second.total;
                        return a.first < b.first;
                      });
    ranked.resize(opt_.max_features);
  }
  std::sort(ranked.begin(), ranked.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  const double n = static_cast<double>(documents.size());
  std::unordered_map<std::string, uint32_t> vocabulary;
  std::vector<double> idf;
  vocabulary.reserve(ranked.size());
  idf.reserve(ranked.size());
  for (auto& [term, st] : ranked) {
    vocabulary.emplace(term, static_cast<uint32_t>(idf.size()));
    idf.push_back(std::log((1.0 + n) / (1.0 + static_cast<double>(st.df))) + 1.0);
  }

  vocabulary_ = std::move(vocabulary);
  idf_ = std::move(idf);
  vocabulary_id_ = next_vocabulary_id_++;
  return rocksdb::Status::OK();
}

std::optional<SparseVector> TfidfVectorizer::Transform(std::string_view text) const {
  std::vector<std::string> terms = Analyze(text);

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (vocabulary_id_ == 0) return std::nullopt;

  std::map<uint32_t, double> weights;
  for (const std::string& term : terms) {
    auto it = vocabulary_.find(term);
    if (it != vocabulary_.end()) weights[it->second] += 1.0;
  }
  if (weights.empty()) return std::nullopt;

  double norm = 0.0;
  for (auto& [index, w] : weights) {
    w *= idf_[index];
    norm += w * w;
  }
  norm = std::sqrt(norm);
  if (norm <= 0.0) return std::nullopt;

  SparseVector out;
  out.vocabulary_id = vocabulary_id_;
  out.indices.reserve(weights.size());
  out.values.reserve(weights.size());
  for (const auto& [index, w] : weights) {
    out.indices.push_back(index);
    out.values.push_back(static_cast<float>(w / norm));
  }
  return out;
}

bool TfidfVectorizer::IsFitted() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return vocabulary_id_ != 0;
}

uint64_t TfidfVectorizer::VocabularyId() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return vocabulary_id_;
}

size_t TfidfVectorizer::VocabularySize() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return idf_.size();
}

void TfidfVectorizer::ReserveVocabularyIds(uint64_t id) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  next_vocabulary_id_ = std::max(next_vocabulary_id_, id + 1);
}

// Layout: [format:1][vocabulary_id:8][term_count:4] then per term in index
// order [term:4+len][idf:8].
std::string TfidfVectorizer::EncodeVocabulary() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<const std::string*> by_index(idf_.size(), nullptr);
  for (const auto& [term, index] : vocabulary_) by_index[index] = &term;

  std::string out;
  out.push_back(static_cast<char>(kVocabularyFormat));
  internal::PutU64LE(&out, vocabulary_id_);
  internal::PutU32LE(&out, static_cast<uint32_t>(idf_.size()));
  for (size_t i = 0; i < idf_.size(); ++i) {
    internal::PutBytes(&out, *by_index[i]);
    internal::PutF64LE(&out, idf_[i]);
  }
  return out;
}

rocksdb::Status TfidfVectorizer::DecodeVocabulary(std::string_view bytes) {
  internal::ByteReader in(bytes);
  uint8_t format = 0;
  uint64_t id = 0;
  uint32_t count = 0;
  if (!in.GetU8(&format) || format != kVocabularyFormat) {
    return rocksdb::Status::Corruption("unknown vocabulary format");
  }
  if (!in.GetU64(&id) || !in.GetU32(&count)) {
    return rocksdb::Status::Corruption("truncated vocabulary header");
  }

  std::unordered_map<std::string, uint32_t> vocabulary;
  std::vector<double> idf;
  vocabulary.reserve(count);
  idf.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    std::string term;
    double weight = 0.0;
    if (!in.GetBytes(&term) || !in.GetF64(&weight)) {
      return rocksdb::Status::Corruption("truncated vocabulary entry");
    }
    vocabulary.emplace(std::move(term), i);
    idf.push_back(weight);
  }
  if (!in.AtEnd()) return rocksdb::Status::Corruption("trailing bytes after vocabulary");

  std::unique_lock<std::shared_mutex> lock(mu_);
  vocabulary_ = std::move(vocabulary);
  idf_ = std::move(idf);
  vocabulary_id_ = id;
  next_vocabulary_id_ = std::max(next_vocabulary_id_, id + 1);
  return rocksdb::Status::OK();
}

double TfidfVectorizer::Similarity(const SparseVector& a, const SparseVector& b) {
  if (a.empty() || b.empty() || a.vocabulary_id != b.vocabulary_id) return 0.0;

  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (float v : a.values) norm_a += static_cast<double>(v) * v;
  for (float v : b.values) norm_b += static_cast<double>(v) * v;

  size_t i = 0, j = 0;
  while (i < a.indices.size() && j < b.indices.size()) {
    if (a.indices[i] == b.indices[j]) {
      dot += static_cast<double>(a.values[i]) * b.values[j];
      ++i;
      ++j;
    } else if (a.indices[i] < b.indices[j]) {
      ++i;
    } else {
      ++j;
    }
  }

  const double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-12) return 0.0;
  return std::max(0.0, dot / denom);
}

}  // namespace verity
