#include <verity/features.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <vector>

#include <verity/normalize.hpp>

namespace verity {

namespace {

std::string AsciiLower(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

bool ContainsAny(const std::string& lower, std::initializer_list<std::string_view> needles) {
  for (std::string_view n : needles) {
    if (lower.find(n) != std::string::npos) return true;
  }
  return false;
}

// Whole-word occurrences of `word` (already lower-case) in lower-cased text.
double CountWholeWord(const std::string& lower, std::string_view word) {
  double count = 0;
  size_t pos = lower.find(word);
  while (pos != std::string::npos) {
    const bool left_ok = pos == 0 || !internal::IsWordByte(static_cast<unsigned char>(lower[pos - 1]));
    const size_t end = pos + word.size();
    const bool right_ok = end >= lower.size() ||
                          !internal::IsWordByte(static_cast<unsigned char>(lower[end]));
    if (left_ok && right_ok) ++count;
    pos = lower.find(word, pos + 1);
  }
  return count;
}

double CountParagraphs(std::string_view text) {
  // Blocks separated by a newline, optional whitespace, and another newline.
  double separators = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '\n') {
      ++i;
      continue;
    }
    size_t j = i + 1;
    size_t last_newline = std::string_view::npos;
    while (j < text.size() && internal::IsAsciiSpace(static_cast<unsigned char>(text[j]))) {
      if (text[j] == '\n') last_newline = j;
      ++j;
    }
    if (last_newline != std::string_view::npos) {
      ++separators;
      i = last_newline + 1;
    } else {
      ++i;
    }
  }
  return separators + 1;
}

double CountSentences(std::string_view text) {
  double pieces = 1;
  bool in_run = false;
  for (char c : text) {
    const bool terminal = c == '.' || c == '!' || c == '?';
    if (terminal && !in_run) ++pieces;
    in_run = terminal;
  }
  return pieces;
}

double CountNumberedSections(std::string_view text) {
  double count = 0;
  size_t line_start = 0;
  while (line_start <= text.size()) {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) line_end = text.size();

    size_t i = line_start;
    while (i < line_end && internal::IsAsciiSpace(static_cast<unsigned char>(text[i]))) ++i;
    size_t digits = 0;
    while (i < line_end && std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
      ++digits;
    }
    if (digits > 0 && i < line_end && text[i] == '.') ++count;

    if (line_end == text.size()) break;
    line_start = line_end + 1;
  }
  return count;
}

// Runs of two or more A-Z that form a whole word.
double CountCapitalizedWords(std::string_view text) {
  double count = 0;
  size_t i = 0;
  while (i < text.size()) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (!internal::IsWordByte(c)) {
      ++i;
      continue;
    }
    size_t start = i;
    bool all_upper = true;
    while (i < text.size() && internal::IsWordByte(static_cast<unsigned char>(text[i]))) {
      const auto w = static_cast<unsigned char>(text[i]);
      if (w < 'A' || w > 'Z') all_upper = false;
      ++i;
    }
    if (all_upper && i - start >= 2) ++count;
  }
  return count;
}

// Non-overlapping open...close spans with no close character inside.
double CountDelimitedSpans(std::string_view text, char open, char close) {
  double count = 0;
  size_t pos = text.find(open);
  while (pos != std::string_view::npos) {
    size_t end = text.find(close, pos + 1);
    if (end == std::string_view::npos) break;
    ++count;
    pos = text.find(open, end + 1);
  }
  return count;
}

bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }

// Non-overlapping matches of `digits ws capital [a-z.]+ ws digits`, leftmost
// first, each match taking its whole trailing digit run. One pass: every run
// is maximal, so a failed attempt never needs to be retried from inside it.
// e.g. "5 Cal. 4", "12 Wash. 2d". Reporter abbreviations with inner capitals
// such as "U.S." do not match.
double CountCitations(std::string_view text) {
  const size_t n = text.size();
  auto skip = [&](size_t i, auto pred) {
    while (i < n && pred(text[i])) ++i;
    return i;
  };
  auto is_space = [](char c) { return internal::IsAsciiSpace(static_cast<unsigned char>(c)); };
  auto is_lower_or_dot = [](char c) { return (c >= 'a' && c <= 'z') || c == '.'; };

  double count = 0;
  size_t i = 0;
  while (i < n) {
    if (!IsAsciiDigit(text[i])) {
      ++i;
      continue;
    }
    const size_t volume_end = skip(i, IsAsciiDigit);
    size_t j = skip(volume_end, is_space);
    if (j == volume_end || j >= n || text[j] < 'A' || text[j] > 'Z') {
      i = std::max(j, volume_end);
      continue;
    }
    ++j;
    const size_t reporter_end = skip(j, is_lower_or_dot);
    if (reporter_end == j) {
      i = j;
      continue;
    }
    j = skip(reporter_end, is_space);
    if (j == reporter_end || j >= n || !IsAsciiDigit(text[j])) {
      i = j;
      continue;
    }
    ++count;
    i = skip(j, IsAsciiDigit);
  }
  return count;
}

double NumericValue(const FeatureValue* v) {
  if (!v) return 0.0;
  if (const bool* b = std::get_if<bool>(v)) return *b ? 1.0 : 0.0;
  return std::get<double>(*v);
}

}  // namespace

StructuralFeatures ExtractStructuralFeatures(std::string_view text) {
  const std::string lower = AsciiLower(text);

  StructuralFeatures f;
  f[feature::kLineCount] =
      static_cast<double>(std::count(text.begin(), text.end(), '\n') + 1);
  f[feature::kParagraphCount] = CountParagraphs(text);
  f[feature::kSentenceCount] = CountSentences(text);
  f[feature::kHasSignatureBlock] = ContainsAny(lower, {"signature", "signed", "executed"});
  f[feature::kHasDateLine] = ContainsAny(lower, {"dated", "date:"});
  f[feature::kHasParties] = ContainsAny(lower, {"plaintiff", "defendant", "party", "parties"});
  f[feature::kWhereasClauses] = CountWholeWord(lower, "whereas");
  f[feature::kNumberedSections] = CountNumberedSections(text);
  f[feature::kCapitalizedWords] = CountCapitalizedWords(text);
  f[feature::kQuotedText] = CountDelimitedSpans(text, '"', '"');
  f[feature::kParentheticalText] = CountDelimitedSpans(text, '(', ')');
  f[feature::kCitationCount] = CountCitations(text);
  return f;
}

double StructuralSimilarity(const StructuralFeatures& a, const StructuralFeatures& b) {
  if (a.empty() || b.empty()) return 0.0;

  std::vector<std::string_view> keys;
  keys.reserve(a.size() + b.size());
  for (const auto& kv : a) keys.push_back(kv.first);
  for (const auto& kv : b) {
    if (a.find(kv.first) == a.end()) keys.push_back(kv.first);
  }
  double total = 0.0;
  for (std::string_view key : keys) {
    auto ia = a.find(std::string(key));
    auto ib = b.find(std::string(key));
    const FeatureValue* va = ia == a.end() ? nullptr : &ia->second;
    const FeatureValue* vb = ib == b.end() ? nullptr : &ib->second;

    if (va && vb && std::holds_alternative<bool>(*va) && std::holds_alternative<bool>(*vb)) {
      total += std::get<bool>(*va) == std::get<bool>(*vb) ? 1.0 : 0.0;
      continue;
    }

    const double x = NumericValue(va);
    const double y = NumericValue(vb);
    if (x == 0.0 && y == 0.0) {
      total += 1.0;
    } else if (x == 0.0 || y == 0.0) {
      total += 0.0;
    } else {
      total += std::min(x, y) / std::max(x, y);
    }
  }
  return total / static_cast<double>(keys.size());
}

}  // namespace verity
