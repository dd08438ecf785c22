#include <verity/normalize.hpp>

#include <algorithm>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace verity::internal {

namespace {

// Single code points rewritten in kUnicode mode, matched after lowercasing.
struct Replacement {
  std::string_view from;
  std::string_view to;
};

constexpr Replacement kReplacements[] = {
    {"\xC2\xB2", "2"},           // superscript two
    {"\xC2\xB3", "3"},           // superscript three
    {"\xC2\xB9", "1"},           // superscript one
    {"\xC2\xBC", "1/4"},
    {"\xC2\xBD", "1/2"},
    {"\xC2\xBE", "3/4"},
    {"\xC3\x9F", "ss"},          // sharp s
    {"\xEF\xAC\x80", "ff"},
    {"\xEF\xAC\x81", "fi"},
    {"\xEF\xAC\x82", "fl"},
    {"\xEF\xAC\x83", "ffi"},
    {"\xEF\xAC\x84", "ffl"},
    {"\xE2\x80\x98", "'"},       // curly quotes
    {"\xE2\x80\x99", "'"},
    {"\xE2\x80\x9C", "\""},
    {"\xE2\x80\x9D", "\""},
    {"\xE2\x80\x93", "-"},       // en dash
    {"\xE2\x80\x94", "-"},       // em dash
};

constexpr UChar32 kCapitalSigma = 0x03A3;
constexpr UChar32 kSmallFinalSigma = 0x03C2;
constexpr UChar32 kSmallSigma = 0x03C3;
constexpr UChar32 kCapitalIWithDot = 0x0130;
constexpr UChar32 kCombiningDotAbove = 0x0307;

// A decoded code point. `c` is negative for an ill-formed byte sequence,
// which is carried through as the raw bytes text[offset, offset + length).
struct CodePoint {
  UChar32 c;
  size_t offset;
  size_t length;
};

std::vector<CodePoint> Decode(std::string_view text) {
  std::vector<CodePoint> out;
  out.reserve(text.size());
  const auto* s = reinterpret_cast<const uint8_t*>(text.data());
  const int64_t length = static_cast<int64_t>(text.size());
  int64_t i = 0;
  while (i < length) {
    const int64_t start = i;
    UChar32 c;
    U8_NEXT(s, i, length, c);
    out.push_back(CodePoint{c, static_cast<size_t>(start), static_cast<size_t>(i - start)});
  }
  return out;
}

void AppendUtf8(UChar32 c, std::string* out) {
  uint8_t buf[U8_MAX_LENGTH];
  int32_t n = 0;
  U8_APPEND_UNSAFE(buf, n, c);
  out->append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
}

bool IsCased(UChar32 c) { return c >= 0 && u_hasBinaryProperty(c, UCHAR_CASED); }
bool IsCaseIgnorable(UChar32 c) {
  return c >= 0 && u_hasBinaryProperty(c, UCHAR_CASE_IGNORABLE);
}

// Final_Sigma: preceded by a cased letter and not followed by one, skipping
// case-ignorable code points in both directions.
bool IsFinalSigma(const std::vector<CodePoint>& cps, size_t i) {
  size_t j = i;
  while (j > 0 && IsCaseIgnorable(cps[j - 1].c)) --j;
  if (j == 0 || !IsCased(cps[j - 1].c)) return false;
  size_t k = i + 1;
  while (k < cps.size() && IsCaseIgnorable(cps[k].c)) ++k;
  return k == cps.size() || !IsCased(cps[k].c);
}

// Full lowercase mapping of cps[i]. Writes one or two code points to `out`
// and returns the count.
int LowerAt(const std::vector<CodePoint>& cps, size_t i, UChar32 out[2]) {
  const UChar32 c = cps[i].c;
  if (c == kCapitalIWithDot) {
    out[0] = 'i';
    out[1] = kCombiningDotAbove;
    return 2;
  }
  if (c == kCapitalSigma) {
    out[0] = IsFinalSigma(cps, i) ? kSmallFinalSigma : kSmallSigma;
    return 1;
  }
  out[0] = u_tolower(c);
  return 1;
}

// Appends the kUnicode rewrite of `lowered` and returns true, or returns
// false when nothing applies.
bool RewriteUnicode(UChar32 lowered, std::string* out) {
  std::string bytes;
  AppendUtf8(lowered, &bytes);
  for (const Replacement& r : kReplacements) {
    if (bytes == r.from) {
      out->append(r.to.data(), r.to.size());
      return true;
    }
  }
  // Fullwidth forms U+FF01..U+FF5E -> ASCII 0x21..0x7E.
  if (lowered >= 0xFF01 && lowered <= 0xFF5E) {
    out->push_back(static_cast<char>(lowered - 0xFEE0));
    return true;
  }
  return false;
}

}  // namespace

bool IsUnicodeSpace(int32_t code_point) {
  return code_point >= 0 && u_isspace(code_point);
}

bool IsWordCodePoint(int32_t code_point) {
  if (code_point < 0) return false;
  return code_point == '_' || u_isalpha(code_point) ||
         u_getIntPropertyValue(code_point, UCHAR_NUMERIC_TYPE) != U_NT_NONE;
}

std::string Normalize(std::string_view input, NormalizationMode mode) {
  const std::vector<CodePoint> cps = Decode(input);

  std::string result;
  result.reserve(input.size());

  bool pending_space = false;
  for (size_t i = 0; i < cps.size(); ++i) {
    const CodePoint& cp = cps[i];
    if (IsUnicodeSpace(cp.c)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }

    if (cp.c < 0) {
      result.append(input.data() + cp.offset, cp.length);
      continue;
    }

    switch (mode) {
      case NormalizationMode::kWhitespace:
        AppendUtf8(cp.c, &result);
        break;
      case NormalizationMode::kASCII:
        AppendUtf8(cp.c >= 'A' && cp.c <= 'Z' ? cp.c - 'A' + 'a' : cp.c, &result);
        break;
      case NormalizationMode::kLowercase:
      case NormalizationMode::kUnicode: {
        UChar32 lowered[2];
        const int n = LowerAt(cps, i, lowered);
        for (int k = 0; k < n; ++k) {
          if (mode == NormalizationMode::kUnicode && RewriteUnicode(lowered[k], &result)) {
            continue;
          }
          AppendUtf8(lowered[k], &result);
        }
        break;
      }
    }
  }
  // A trailing whitespace run never emits its space.
  return result;
}

std::string Lowercase(std::string_view text) {
  const std::vector<CodePoint> cps = Decode(text);
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < cps.size(); ++i) {
    if (cps[i].c < 0) {
      out.append(text.data() + cps[i].offset, cps[i].length);
      continue;
    }
    UChar32 lowered[2];
    const int n = LowerAt(cps, i, lowered);
    for (int k = 0; k < n; ++k) AppendUtf8(lowered[k], &out);
  }
  return out;
}

std::vector<std::string> SignificantWords(std::string_view text) {
  const std::vector<CodePoint> cps = Decode(text);
  std::vector<std::string> words;
  std::string current;
  uint64_t current_cp = 0;

  auto flush = [&]() {
    if (current_cp > 3) words.push_back(current);
    current.clear();
    current_cp = 0;
  };

  for (size_t i = 0; i < cps.size(); ++i) {
    const CodePoint& cp = cps[i];
    if (IsUnicodeSpace(cp.c)) {
      flush();
      continue;
    }
    if (cp.c < 0) {
      // Undecodable bytes stay part of the word, one unit per byte.
      current.append(text.data() + cp.offset, cp.length);
      current_cp += cp.length;
      continue;
    }
    UChar32 lowered[2];
    const int n = LowerAt(cps, i, lowered);
    for (int k = 0; k < n; ++k) {
      if (!IsWordCodePoint(lowered[k])) continue;  // punctuation vanishes without splitting
      AppendUtf8(lowered[k], &current);
      ++current_cp;
    }
  }
  flush();

  std::sort(words.begin(), words.end());
  return words;
}

uint64_t CountWords(std::string_view text) {
  uint64_t count = 0;
  bool in_word = false;
  for (const CodePoint& cp : Decode(text)) {
    if (IsUnicodeSpace(cp.c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return count;
}

uint64_t CountCodePoints(std::string_view text) {
  uint64_t count = 0;
  for (char ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) ++count;
  }
  return count;
}

std::string_view TruncateCodePoints(std::string_view text, size_t max_code_points) {
  size_t seen = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
      if (seen == max_code_points) return text.substr(0, i);
      ++seen;
    }
  }
  return text;
}

}  // namespace verity::internal
