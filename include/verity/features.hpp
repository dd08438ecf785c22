#pragma once

#include <string_view>

#include <verity/types.hpp>

namespace verity {

/** Feature names produced by ExtractStructuralFeatures(). */
namespace feature {
inline constexpr const char* kLineCount = "line_count";
inline constexpr const char* kParagraphCount = "paragraph_count";
inline constexpr const char* kSentenceCount = "sentence_count";
inline constexpr const char* kHasSignatureBlock = "has_signature_block";
inline constexpr const char* kHasDateLine = "has_date_line";
inline constexpr const char* kHasParties = "has_parties";
inline constexpr const char* kWhereasClauses = "has_whereas_clauses";
inline constexpr const char* kNumberedSections = "has_numbered_sections";
inline constexpr const char* kCapitalizedWords = "capitalized_words";
inline constexpr const char* kQuotedText = "quoted_text";
inline constexpr const char* kParentheticalText = "parenthetical_text";
inline constexpr const char* kCitationCount = "citation_count";
}  // namespace feature

/**
 * Extract layout and legal-boilerplate features from raw text.
 *
 * Counts are stored as numbers; signature/date/parties presence as flags.
 * Keyword searches are case-insensitive substring matches, except "whereas"
 * which only counts whole words.
 */
StructuralFeatures ExtractStructuralFeatures(std::string_view text);

/**
 * Similarity of two feature maps in [0,1].
 *
 * Mean over the union of keys. Two flags score 1 when equal; numbers score
 * min/max (both zero counts as equal, exactly one zero as 0). A key missing
 * on one side counts as the number 0; a flag compared with a number is
 * treated as 0/1. An empty map on either side scores 0.
 */
double StructuralSimilarity(const StructuralFeatures& a, const StructuralFeatures& b);

}  // namespace verity
