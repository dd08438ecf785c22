#include <verity/server/config.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace verity::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>          Path to config file\n"
            << "  --host <addr>                Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>            Listen port (default: 8080)\n"
            << "  --threads <n>                HTTP worker threads (default: auto)\n"
            << "  --db-path <path>             Persist fingerprints in RocksDB at <path>\n"
            << "  --threshold <x>              Similarity threshold in [0,1] (default: 0.8)\n"
            << "  --comparison-threads <n>     Batch comparison threads (default: 1)\n"
            << "  --model-path <path>          ONNX embedding model (semantic builds)\n"
            << "  --batch-timeout-ms <ms>      Deadline for bulk requests (default: 30000)\n"
            << "  --log-level <level>          Log level: debug, info, warn, error\n"
            << "  --no-metrics                 Disable the metrics endpoint\n"
            << "  --help, -h                   Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --db-path /data/verity --port 8080\n"
            << "  " << argv0 << " --config /etc/verity/server.yaml --threshold 0.85\n";
}

std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value,
                       uint64_t max = std::numeric_limits<uint64_t>::max()) {
  size_t used = 0;
  unsigned long long parsed = 0;
  try {
    if (!value.empty() && value[0] == '-') throw std::invalid_argument(value);
    parsed = std::stoull(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
  if (used != value.size() || parsed > max) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
  return parsed;
}

int ParseInt(const std::string& key, const std::string& value) {
  return static_cast<int>(
      ParseUnsigned(key, value, static_cast<uint64_t>(std::numeric_limits<int>::max())));
}

double ParseDouble(const std::string& key, const std::string& value) {
  size_t used = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
  if (used != value.size()) throw std::runtime_error("Invalid value for " + key + ": " + value);
  return parsed;
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

NormalizationMode ParseNormalization(const std::string& value) {
  if (value == "whitespace") return NormalizationMode::kWhitespace;
  if (value == "ascii") return NormalizationMode::kASCII;
  if (value == "lowercase") return NormalizationMode::kLowercase;
  if (value == "unicode") return NormalizationMode::kUnicode;
  throw std::runtime_error("Invalid normalization: " + value +
                           " (must be whitespace, ascii or unicode)");
}

EmbedderModelType ParseModelType(const std::string& value) {
  if (value == "minilm") return EmbedderModelType::kMiniLM;
  if (value == "bge-small") return EmbedderModelType::kBGESmall;
  if (value == "bge-large") return EmbedderModelType::kBGELarge;
  throw std::runtime_error("Invalid semantic_model_type: " + value +
                           " (must be minilm, bge-small or bge-large)");
}

void ApplyServerKey(ServerConfig* server, const std::string& key, const std::string& value) {
  if (key == "host") {
    server->host = value;
  } else if (key == "port") {
    server->port = static_cast<uint16_t>(ParseUnsigned("server.port", value, 65535));
  } else if (key == "threads") {
    server->threads = static_cast<uint32_t>(ParseUnsigned("server.threads", value, UINT32_MAX));
  } else if (key == "log_level") {
    server->log_level = value;
  } else if (key == "batch_timeout_ms") {
    server->batch_timeout_ms =
        static_cast<uint32_t>(ParseUnsigned("server.batch_timeout_ms", value, UINT32_MAX));
  } else {
    throw std::runtime_error("Unknown key server." + key);
  }
}

void ApplyDetectorKey(verity::Options* opt, const std::string& key, const std::string& value) {
  const std::string name = "detector." + key;
  if (key == "db_path") {
    opt->db_path = value;
  } else if (key == "sync_writes") {
    opt->sync_writes = ParseBool(name, value);
  } else if (key == "similarity_threshold") {
    opt->similarity_threshold = ParseDouble(name, value);
  } else if (key == "normalization") {
    opt->normalization = ParseNormalization(value);
  } else if (key == "semantic_max_chars") {
    opt->semantic_max_chars = ParseUnsigned(name, value);
  } else if (key == "embed_timeout_ms") {
    opt->embed_timeout_ms = ParseInt(name, value);
  } else if (key == "image_hash_timeout_ms") {
    opt->image_hash_timeout_ms = ParseInt(name, value);
  } else if (key == "collaborator_threads") {
    opt->collaborator_threads = ParseInt(name, value);
  } else if (key == "max_abandoned_collaborator_calls") {
    opt->max_abandoned_collaborator_calls = ParseInt(name, value);
  } else if (key == "comparison_threads") {
    opt->comparison_threads = ParseInt(name, value);
  } else if (key == "cache_shards") {
    opt->cache_shards = ParseUnsigned(name, value);
  } else if (key == "registry_shards") {
    opt->registry_shards = ParseUnsigned(name, value);
  } else if (key == "tfidf_max_features") {
    opt->tfidf_max_features = ParseUnsigned(name, value);
  } else if (key == "tfidf_ngram_max") {
    opt->tfidf_ngram_max = ParseInt(name, value);
  } else if (key == "use_candidate_index") {
    opt->use_candidate_index = ParseBool(name, value);
  } else if (key == "candidate_k") {
    opt->candidate_k = ParseInt(name, value);
  } else if (key == "hnsw_m") {
    opt->hnsw_m = ParseInt(name, value);
  } else if (key == "hnsw_ef_construction") {
    opt->hnsw_ef_construction = ParseInt(name, value);
  } else if (key == "hnsw_ef_search") {
    opt->hnsw_ef_search = ParseInt(name, value);
  } else if (key == "semantic_model_path") {
    opt->semantic_model_path = value;
  } else if (key == "semantic_model_type") {
    opt->semantic_model_type = ParseModelType(value);
  } else if (key == "semantic_num_threads") {
    opt->semantic_num_threads = ParseInt(name, value);
  } else {
    throw std::runtime_error("Unknown key " + name);
  }
}

void ApplyMetricsKey(MetricsConfig* metrics, const std::string& key, const std::string& value) {
  if (key == "enabled") {
    metrics->enabled = ParseBool("metrics.enabled", value);
  } else if (key == "path") {
    metrics->path = value;
  } else {
    throw std::runtime_error("Unknown key metrics." + key);
  }
}

// Value of the flag at argv[*i], advancing past it.
std::string FlagValue(int argc, char** argv, int* i, const std::string& flag) {
  if (++*i >= argc) throw std::runtime_error(flag + " requires a value");
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }
  return LoadFromStream(file);
}

Config Config::LoadFromStream(std::istream& in) {
  Config config;
  std::string current_section;
  std::string line;
  int line_number = 0;

  while (std::getline(in, line)) {
    ++line_number;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("Config line " + std::to_string(line_number) +
                               ": expected 'key: value'");
    }
    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      if (key != "server" && key != "detector" && key != "metrics") {
        throw std::runtime_error("Unknown config section: " + key);
      }
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "server") {
      ApplyServerKey(&config.server, key, value);
    } else if (current_section == "detector") {
      ApplyDetectorKey(&config.detector, key, value);
    } else if (current_section == "metrics") {
      ApplyMetricsKey(&config.metrics, key, value);
    } else if (key == "db_path") {
      // Top-level shorthand
      config.detector.db_path = value;
    } else {
      throw std::runtime_error("Unknown top-level key: " + key);
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The file provides the base; every other flag overrides it.
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config = LoadFromFile(FlagValue(argc, argv, &i, arg));
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;  // already loaded
    } else if (arg == "--host") {
      config.server.host = FlagValue(argc, argv, &i, arg);
    } else if (arg == "--port" || arg == "-p") {
      config.server.port =
          static_cast<uint16_t>(ParseUnsigned(arg, FlagValue(argc, argv, &i, arg), 65535));
    } else if (arg == "--threads") {
      config.server.threads =
          static_cast<uint32_t>(ParseUnsigned(arg, FlagValue(argc, argv, &i, arg), UINT32_MAX));
    } else if (arg == "--db-path") {
      config.detector.db_path = FlagValue(argc, argv, &i, arg);
    } else if (arg == "--threshold") {
      config.detector.similarity_threshold = ParseDouble(arg, FlagValue(argc, argv, &i, arg));
    } else if (arg == "--comparison-threads") {
      config.detector.comparison_threads = ParseInt(arg, FlagValue(argc, argv, &i, arg));
    } else if (arg == "--model-path") {
      config.detector.semantic_model_path = FlagValue(argc, argv, &i, arg);
    } else if (arg == "--batch-timeout-ms") {
      config.server.batch_timeout_ms =
          static_cast<uint32_t>(ParseUnsigned(arg, FlagValue(argc, argv, &i, arg), UINT32_MAX));
    } else if (arg == "--log-level") {
      config.server.log_level = FlagValue(argc, argv, &i, arg);
    } else if (arg == "--no-metrics") {
      config.metrics.enabled = false;
    } else {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  if (!(detector.similarity_threshold >= 0.0 && detector.similarity_threshold <= 1.0)) {
    throw std::runtime_error("detector.similarity_threshold must be in [0, 1]");
  }

  if (detector.cache_shards == 0 || detector.registry_shards == 0) {
    throw std::runtime_error("detector shard counts must be positive");
  }

  if (detector.tfidf_ngram_max < 1) {
    throw std::runtime_error("detector.tfidf_ngram_max must be >= 1");
  }

  if (detector.collaborator_threads < 1 || detector.max_abandoned_collaborator_calls < 1) {
    throw std::runtime_error(
        "detector.collaborator_threads and max_abandoned_collaborator_calls must be >= 1");
  }

  if (detector.use_candidate_index && detector.candidate_k <= 0) {
    throw std::runtime_error("detector.candidate_k must be positive");
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/'");
  }

  // Validate log level
  ParseLogLevel(server.log_level);
}

trantor::Logger::LogLevel ParseLogLevel(const std::string& name) {
  if (name == "debug") return trantor::Logger::kDebug;
  if (name == "info") return trantor::Logger::kInfo;
  if (name == "warn") return trantor::Logger::kWarn;
  if (name == "error") return trantor::Logger::kError;
  throw std::runtime_error("Invalid log_level: " + name +
                           " (must be debug, info, warn, or error)");
}

}  // namespace verity::server
