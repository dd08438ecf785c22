#include <verity/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

#include <unicode/utf8.h>

namespace verity {

namespace {

void AppendHex4(uint32_t unit, std::string* out) {
  static const char kHex[] = "0123456789abcdef";
  out->append("\\u");
  for (int shift = 12; shift >= 0; shift -= 4) out->push_back(kHex[(unit >> shift) & 0xF]);
}

void AppendEscapedString(const std::string& s, std::string* out) {
  out->push_back('"');
  const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
  const int64_t length = static_cast<int64_t>(s.size());
  int64_t i = 0;
  while (i < length) {
    UChar32 c;
    U8_NEXT_OR_FFFD(bytes, i, length, c);
    switch (c) {
      case '"': out->append("\\\""); continue;
      case '\\': out->append("\\\\"); continue;
      case '\n': out->append("\\n"); continue;
      case '\r': out->append("\\r"); continue;
      case '\t': out->append("\\t"); continue;
      case '\b': out->append("\\b"); continue;
      case '\f': out->append("\\f"); continue;
      default: break;
    }
    if (c >= 0x20 && c <= 0x7E) {
      out->push_back(static_cast<char>(c));
    } else if (c > 0xFFFF) {
      const uint32_t v = static_cast<uint32_t>(c) - 0x10000;
      AppendHex4(0xD800 | (v >> 10), out);
      AppendHex4(0xDC00 | (v & 0x3FF), out);
    } else {
      AppendHex4(static_cast<uint32_t>(c), out);
    }
  }
  out->push_back('"');
}

// Shortest decimal form that reads back as `d`. Fixed notation for decimal
// exponents -4 through 15, scientific otherwise.
void AppendReal(double d, std::string* out) {
  if (std::isnan(d)) {
    out->append("NaN");
    return;
  }
  if (std::isinf(d)) {
    out->append(d < 0 ? "-Infinity" : "Infinity");
    return;
  }

  char buf[32];
  for (int precision = 0; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*e", precision, d);
    if (std::strtod(buf, nullptr) == d) break;
  }

  // buf is [-]d[.ddd]e(+|-)XX
  std::string text(buf);
  const bool negative = text[0] == '-';
  if (negative) text.erase(0, 1);
  const size_t e = text.find('e');
  const int exponent = std::atoi(text.c_str() + e + 1);
  std::string digits = text.substr(0, e);
  digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
  while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

  if (negative) out->push_back('-');
  const int point = exponent + 1;  // digits before the decimal point
  if (point <= -4 || point > 16) {
    out->push_back(digits[0]);
    if (digits.size() > 1) {
      out->push_back('.');
      out->append(digits, 1, std::string::npos);
    }
    char exp_buf[8];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                  std::abs(exponent));
    out->append(exp_buf);
  } else if (point <= 0) {
    out->append("0.");
    out->append(static_cast<size_t>(-point), '0');
    out->append(digits);
  } else if (static_cast<size_t>(point) < digits.size()) {
    out->append(digits, 0, static_cast<size_t>(point));
    out->push_back('.');
    out->append(digits, static_cast<size_t>(point), std::string::npos);
  } else {
    out->append(digits);
    out->append(static_cast<size_t>(point) - digits.size(), '0');
    out->append(".0");
  }
}

void AppendSorted(const Json::Value& value, std::string* out) {
  switch (value.type()) {
    case Json::nullValue:
      out->append("null");
      break;
    case Json::booleanValue:
      out->append(value.asBool() ? "true" : "false");
      break;
    case Json::intValue:
      out->append(std::to_string(value.asLargestInt()));
      break;
    case Json::uintValue:
      out->append(std::to_string(value.asLargestUInt()));
      break;
    case Json::realValue:
      AppendReal(value.asDouble(), out);
      break;
    case Json::stringValue:
      AppendEscapedString(value.asString(), out);
      break;
    case Json::arrayValue: {
      out->push_back('[');
      for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        if (i > 0) out->append(", ");
        AppendSorted(value[i], out);
      }
      out->push_back(']');
      break;
    }
    case Json::objectValue: {
      std::vector<std::string> keys = value.getMemberNames();
      std::sort(keys.begin(), keys.end());
      out->push_back('{');
      for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) out->append(", ");
        AppendEscapedString(keys[i], out);
        out->append(": ");
        AppendSorted(value[keys[i]], out);
      }
      out->push_back('}');
      break;
    }
  }
}

Json::Value ScoresToJson(const SimilarityBreakdown& s) {
  Json::Value json;
  json["hash_match"] = s.hash_match;
  json["fuzzy"] = s.fuzzy;
  json["tfidf"] = s.tfidf;
  json["semantic"] = s.semantic;
  json["structural"] = s.structural;
  json["visual"] = s.visual;
  json["metadata"] = s.metadata;
  json["fused"] = s.fused;
  return json;
}

std::string Str(std::string_view v) { return std::string(v); }

}  // namespace

Json::Value MatchToJson(const DuplicateMatch& match) {
  Json::Value json;
  json["document_id_1"] = match.document_id_1;
  json["document_id_2"] = match.document_id_2;
  json["duplicate_type"] = Str(DuplicateTypeName(match.duplicate_type));
  json["similarity_score"] = match.similarity_score;
  json["confidence"] = match.confidence;
  json["method_used"] = Str(SimilarityMethodName(match.method_used));
  json["timestamp_us"] = static_cast<Json::UInt64>(match.timestamp_us);

  Json::Value details;
  details["scores"] = ScoresToJson(match.details.scores);
  details["word_count_diff"] = static_cast<Json::UInt64>(match.details.word_count_diff);
  details["page_count_diff"] = static_cast<Json::UInt64>(match.details.page_count_diff);
  details["cached"] = match.details.cached;
  json["details"] = details;
  return json;
}

Json::Value MatchesToJson(const std::vector<DuplicateMatch>& matches) {
  Json::Value json(Json::arrayValue);
  for (const DuplicateMatch& m : matches) json.append(MatchToJson(m));
  return json;
}

Json::Value FingerprintSummaryToJson(const DocumentFingerprint& fp) {
  Json::Value json;
  json["document_id"] = fp.document_id;
  json["content_hash"] = fp.content_hash;
  json["fuzzy_hash"] = fp.fuzzy_hash;
  json["metadata_hash"] = fp.metadata_hash;
  json["word_count"] = static_cast<Json::UInt64>(fp.word_count);
  json["char_count"] = static_cast<Json::UInt64>(fp.char_count);
  json["page_count"] = static_cast<Json::UInt64>(fp.page_count);
  json["created_at_us"] = static_cast<Json::UInt64>(fp.created_at_us);

  Json::Value features(Json::objectValue);
  for (const auto& [name, value] : fp.structural_features) {
    if (const bool* flag = std::get_if<bool>(&value)) {
      features[name] = *flag;
    } else {
      features[name] = std::get<double>(value);
    }
  }
  json["structural_features"] = features;

  Json::Value signals;
  signals["tfidf"] = fp.tfidf_vector.has_value();
  signals["semantic"] = fp.semantic_vector.has_value();
  signals["visual"] = fp.visual_hash.has_value();
  json["signals"] = signals;
  if (fp.tfidf_vector) {
    json["tfidf_vocabulary_id"] = static_cast<Json::UInt64>(fp.tfidf_vector->vocabulary_id);
  }
  if (fp.semantic_vector) {
    json["semantic_dimension"] = static_cast<Json::UInt64>(fp.semantic_vector->size());
  }
  if (fp.visual_hash) json["visual_hash"] = *fp.visual_hash;
  return json;
}

Json::Value StatisticsToJson(const Statistics& stats) {
  Json::Value json;
  json["total_documents"] = static_cast<Json::UInt64>(stats.total_documents);
  json["cached_comparisons"] = static_cast<Json::UInt64>(stats.cached_comparisons);
  json["similarity_threshold"] = stats.similarity_threshold;
  json["semantic_vectors"] = static_cast<Json::UInt64>(stats.semantic_vectors);
  json["visual_hashes"] = static_cast<Json::UInt64>(stats.visual_hashes);
  json["tfidf_vocabulary_size"] = static_cast<Json::UInt64>(stats.tfidf_vocabulary_size);
  json["comparisons_total"] = static_cast<Json::UInt64>(stats.comparisons_total);
  json["cache_hits_total"] = static_cast<Json::UInt64>(stats.cache_hits_total);
  json["cache_stale_total"] = static_cast<Json::UInt64>(stats.cache_stale_total);

  Json::Value times(Json::objectValue);
  for (const auto& [id, created_at_us] : stats.fingerprint_creation_times) {
    times[id] = static_cast<Json::UInt64>(created_at_us);
  }
  json["fingerprint_creation_times"] = times;
  return json;
}

Json::Value ClustersToJson(const std::vector<Cluster>& clusters) {
  Json::Value json(Json::arrayValue);
  for (const Cluster& c : clusters) json.append(StringsToJson(c));
  return json;
}

Json::Value DecisionsToJson(const std::vector<DedupDecision>& decisions) {
  Json::Value json(Json::arrayValue);
  for (const DedupDecision& d : decisions) {
    Json::Value entry;
    entry["keeper"] = d.keeper;
    entry["dropped"] = StringsToJson(d.dropped);
    json.append(entry);
  }
  return json;
}

Json::Value StringsToJson(const std::vector<std::string>& values) {
  Json::Value json(Json::arrayValue);
  for (const std::string& v : values) json.append(v);
  return json;
}

std::string WriteJson(const Json::Value& value) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, value);
}

std::string WriteSortedJson(const Json::Value& value) {
  std::string out;
  AppendSorted(value, &out);
  return out;
}

std::string WritePrettyJson(const Json::Value& value) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, value);
}

bool ParseJson(std::string_view text, Json::Value* out, std::string* error) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), out, &errors)) {
    if (error) *error = errors;
    return false;
  }
  return true;
}

bool ReadStringArray(const Json::Value& object, const char* key,
                     std::vector<std::string>* out, bool* present, std::string* error) {
  *present = false;
  if (!object.isObject() || !object.isMember(key) || object[key].isNull()) return true;

  const Json::Value& array = object[key];
  if (!array.isArray()) {
    if (error) *error = std::string("'") + key + "' must be an array of strings";
    return false;
  }
  out->clear();
  for (const Json::Value& item : array) {
    if (!item.isString()) {
      if (error) *error = std::string("'") + key + "' must contain only strings";
      return false;
    }
    out->push_back(item.asString());
  }
  *present = true;
  return true;
}

}  // namespace verity
