#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <verity/types.hpp>

namespace verity {

// JSON views of detector results, shared by the CLI and the HTTP server.
// Enum values use their lower-case names; times are microseconds.

Json::Value MatchToJson(const DuplicateMatch& match);
Json::Value MatchesToJson(const std::vector<DuplicateMatch>& matches);

/** Hashes, counts and which optional signals are present (no vectors). */
Json::Value FingerprintSummaryToJson(const DocumentFingerprint& fp);

Json::Value StatisticsToJson(const Statistics& stats);
Json::Value ClustersToJson(const std::vector<Cluster>& clusters);
Json::Value DecisionsToJson(const std::vector<DedupDecision>& decisions);
Json::Value StringsToJson(const std::vector<std::string>& values);

/** Compact single-line serialization. */
std::string WriteJson(const Json::Value& value);

/**
 * Canonical serialization used for metadata hashing: object keys sorted
 * bytewise, ", " and ": " separators, every code point outside printable
 * ASCII escaped as \uXXXX (astral planes as surrogate pairs), integers in
 * decimal and reals in shortest round-trip form ("1.0", "1e-05", "1e+16").
 * Byte-for-byte what Python's json.dumps(value, sort_keys=True) produces.
 */
std::string WriteSortedJson(const Json::Value& value);

/** Indented serialization for humans. */
std::string WritePrettyJson(const Json::Value& value);

/** False (with *error set) on malformed input. */
bool ParseJson(std::string_view text, Json::Value* out, std::string* error);

/**
 * Read an optional array of strings at `key`. Absent or null leaves
 * *present false; any other non-array (or a non-string element) is an error.
 */
bool ReadStringArray(const Json::Value& object, const char* key,
                     std::vector<std::string>* out, bool* present, std::string* error);

}  // namespace verity
