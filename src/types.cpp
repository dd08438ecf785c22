#include <verity/types.hpp>

namespace verity {

std::string_view DuplicateTypeName(DuplicateType type) {
  switch (type) {
    case DuplicateType::kExact: return "exact";
    case DuplicateType::kNearExact: return "near_exact";
    case DuplicateType::kVersion: return "version";
    case DuplicateType::kTemplate: return "template";
    case DuplicateType::kSimilar: return "similar";
    case DuplicateType::kPartial: return "partial";
    case DuplicateType::kNotDuplicate: return "not_duplicate";
  }
  return "not_duplicate";
}

std::string_view SimilarityMethodName(SimilarityMethod method) {
  switch (method) {
    case SimilarityMethod::kHash: return "hash";
    case SimilarityMethod::kFuzzy: return "fuzzy";
    case SimilarityMethod::kTfidf: return "tfidf";
    case SimilarityMethod::kSemantic: return "semantic";
    case SimilarityMethod::kStructural: return "structural";
    case SimilarityMethod::kVisual: return "visual";
    case SimilarityMethod::kMetadata: return "metadata";
  }
  return "hash";
}

std::string_view KeepStrategyName(KeepStrategy strategy) {
  switch (strategy) {
    case KeepStrategy::kNewest: return "newest";
    case KeepStrategy::kOldest: return "oldest";
    case KeepStrategy::kLongest: return "longest";
    case KeepStrategy::kShortest: return "shortest";
  }
  return "newest";
}

bool ParseKeepStrategy(std::string_view name, KeepStrategy* out) {
  if (!out) return false;
  static constexpr KeepStrategy kAll[] = {KeepStrategy::kNewest, KeepStrategy::kOldest,
                                          KeepStrategy::kLongest, KeepStrategy::kShortest};
  for (KeepStrategy s : kAll) {
    if (KeepStrategyName(s) == name) {
      *out = s;
      return true;
    }
  }
  return false;
}

}  // namespace verity
