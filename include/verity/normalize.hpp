#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace verity {

/** Normalization level applied before the content hash is computed.
 *  The document text itself is never modified.
 *
 *  Every mode trims and collapses runs of Unicode whitespace (the White_Space
 *  property plus the C0 separators U+001C..U+001F), so U+00A0 and U+3000
 *  separate words the same way ASCII spaces do.
 */
enum class NormalizationMode {
  kWhitespace,     // Collapse whitespace runs to single space, trim edges
  kASCII,          // Whitespace + ASCII case folding only (A-Z -> a-z)
  kLowercase,      // Whitespace + full Unicode lowercase mapping (default)
  kUnicode         // kLowercase + ligatures, fullwidth forms, typographic quotes
};

namespace internal {

/**
 * Normalize text for content hashing.
 *
 * - kWhitespace: trims and collapses whitespace runs to one space
 * - kASCII: + ASCII lowercase (A-Z -> a-z)
 * - kLowercase: + Unicode lowercase, including the context-dependent final
 *   sigma and U+0130 -> "i̇"
 * - kUnicode: kLowercase, then common ligatures, sharp s and superscript
 *   digits spelled out, fullwidth ASCII mapped to ASCII, curly quotes and
 *   dashes mapped to their ASCII forms
 *
 * Ill-formed UTF-8 bytes are copied through unchanged.
 */
std::string Normalize(std::string_view input, NormalizationMode mode);

/** Full Unicode lowercase mapping of `text`; whitespace is left alone. */
std::string Lowercase(std::string_view text);

/**
 * Words used for the order-invariant fuzzy hash.
 *
 * Lower-cases with the full Unicode mapping, removes every code point that is
 * neither a word character (letters, numerics, '_') nor whitespace, splits on
 * whitespace and keeps words longer than three code points. The result is
 * sorted bytewise.
 */
std::vector<std::string> SignificantWords(std::string_view text);

/** Number of whitespace separated words. */
uint64_t CountWords(std::string_view text);

/** Number of Unicode code points (UTF-8 continuation bytes are skipped). */
uint64_t CountCodePoints(std::string_view text);

/** First `max_code_points` code points of text, never splitting a sequence. */
std::string_view TruncateCodePoints(std::string_view text, size_t max_code_points);

/** Unicode whitespace as used by Normalize() and SignificantWords(). */
bool IsUnicodeSpace(int32_t code_point);

/** Letter, numeric or '_'. */
bool IsWordCodePoint(int32_t code_point);

inline bool IsAsciiSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// \w in the sense used by the feature extractors: ASCII alnum, '_' and any
// byte belonging to a non-ASCII code point.
inline bool IsWordByte(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_' || c >= 0x80;
}

}  // namespace internal
}  // namespace verity
