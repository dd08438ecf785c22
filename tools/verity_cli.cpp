#include <verity/detector.hpp>
#include <verity/json.hpp>
#include <verity/shutdown.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [flags] load <corpus.jsonl>       (fingerprint into --db-path)\n"
      << "  " << argv0 << " [flags] stats [corpus.jsonl]\n"
      << "  " << argv0 << " [flags] find <id> [corpus.jsonl]\n"
      << "  " << argv0 << " [flags] batch [corpus.jsonl]\n"
      << "  " << argv0 << " [flags] clusters [corpus.jsonl]\n"
      << "  " << argv0 << " [flags] dedup <newest|oldest|longest|shortest> [corpus.jsonl]\n"
      << "\n"
      << "flags:\n"
      << "  --threshold <x>     similarity threshold (default 0.8)\n"
      << "  --threads <n>       comparison threads (0 = all cores)\n"
      << "  --db-path <dir>     persistent fingerprint store\n"
      << "  --timeout-ms <n>    deadline for bulk commands (0 = none)\n"
      << "  --verbose           debug logging\n"
      << "\n"
      << "Corpus lines are JSON objects: {\"id\": ..., \"text\": ..., \"metadata\": {...}}.\n"
      << "Ctrl-C aborts a running bulk command.\n";
}

// Fingerprint every line of a JSONL corpus. Returns the number loaded.
static rocksdb::Status LoadCorpus(verity::Detector* detector, const std::string& path,
                                  uint64_t* loaded) {
  std::ifstream in(path);
  if (!in) {
    return rocksdb::Status::IOError("cannot open corpus", path);
  }
  std::string line;
  uint64_t line_no = 0;
  *loaded = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    Json::Value doc;
    std::string error;
    if (!verity::ParseJson(line, &doc, &error) || !doc.isObject()) {
      return rocksdb::Status::InvalidArgument(
          path + ":" + std::to_string(line_no), error.empty() ? "not a JSON object" : error);
    }
    if (!doc["id"].isString() || !doc["text"].isString()) {
      return rocksdb::Status::InvalidArgument(path + ":" + std::to_string(line_no),
                                              "'id' and 'text' must be strings");
    }
    auto s = detector->CreateFingerprint(doc["id"].asString(), doc["text"].asString(),
                                         doc["metadata"], doc.get("image_ref", "").asString());
    if (!s.ok()) return s;
    ++*loaded;
  }
  return rocksdb::Status::OK();
}

int main(int argc, char** argv) {
  verity::Options opt;
  int timeout_ms = 0;
  std::vector<std::string> args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("Missing value for " + arg);
        return argv[++i];
      };
      if (arg == "--threshold") {
        opt.similarity_threshold = std::stod(value());
      } else if (arg == "--threads") {
        opt.comparison_threads = std::stoi(value());
      } else if (arg == "--db-path") {
        opt.db_path = value();
      } else if (arg == "--timeout-ms") {
        timeout_ms = std::stoi(value());
      } else if (arg == "--verbose") {
        trantor::Logger::setLogLevel(trantor::Logger::kDebug);
      } else if (arg == "--help" || arg == "-h") {
        usage(argv[0]);
        return 0;
      } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
        throw std::runtime_error("Unknown flag: " + arg);
      } else {
        args.push_back(arg);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Invalid arguments: " << e.what() << "\n";
    return 2;
  }

  if (args.empty()) { usage(argv[0]); return 2; }
  const std::string cmd = args[0];

  // Positional arguments after the command, before the optional corpus.
  size_t fixed = 0;
  if (cmd == "find" || cmd == "dedup") {
    fixed = 1;
  } else if (cmd != "load" && cmd != "stats" && cmd != "batch" && cmd != "clusters") {
    usage(argv[0]);
    return 2;
  }
  if (args.size() < 1 + fixed || args.size() > 2 + fixed) { usage(argv[0]); return 2; }
  const std::string corpus = args.size() == 2 + fixed ? args.back() : std::string();
  if (corpus.empty() && (cmd == "load" || opt.db_path.empty())) {
    std::cerr << "A corpus file is required" << (cmd == "load" ? "" : " without --db-path")
              << "\n";
    return 2;
  }
  if (cmd == "load" && opt.db_path.empty()) {
    std::cerr << "load requires --db-path\n";
    return 2;
  }

  verity::KeepStrategy strategy = verity::KeepStrategy::kNewest;
  if (cmd == "dedup" && !verity::ParseKeepStrategy(args[1], &strategy)) {
    std::cerr << "Unknown strategy: " << args[1] << "\n";
    return 2;
  }

  std::unique_ptr<verity::Detector> detector;
  auto s = verity::Detector::Open(opt, &detector);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  if (!corpus.empty()) {
    uint64_t loaded = 0;
    s = LoadCorpus(detector.get(), corpus, &loaded);
    if (!s.ok()) {
      std::cerr << "Load failed: " << s.ToString() << "\n";
      return 1;
    }
    if (cmd == "load") {
      std::cout << "loaded=" << loaded << "\n";
      detector->Close();
      return 0;
    }
  }

  auto& shutdown = verity::GlobalShutdownHandler();
  shutdown.InstallSignalHandlers();
  const auto ctl = verity::RunControl::WithTimeout(std::chrono::milliseconds(timeout_ms),
                                                   shutdown.CancelFlag());

  Json::Value result;
  if (cmd == "stats") {
    result = verity::StatisticsToJson(detector->GetStatistics());
  } else if (cmd == "find") {
    std::vector<verity::DuplicateMatch> matches;
    s = detector->FindDuplicates(args[1], nullptr, &matches, ctl);
    result["document_id"] = args[1];
    result["matches"] = verity::MatchesToJson(matches);
  } else if (cmd == "batch") {
    std::vector<verity::DuplicateMatch> matches;
    s = detector->BatchDetectDuplicates(nullptr, &matches, ctl);
    result["matches"] = verity::MatchesToJson(matches);
  } else if (cmd == "clusters") {
    std::vector<verity::Cluster> clusters;
    s = detector->GetDuplicateClusters(nullptr, &clusters, ctl);
    result["clusters"] = verity::ClustersToJson(clusters);
  } else {
    std::vector<std::string> keep;
    std::vector<verity::DedupDecision> decisions;
    s = detector->RemoveDuplicates(nullptr, strategy, &keep, &decisions, ctl);
    result["strategy"] = args[1];
    result["keep"] = verity::StringsToJson(keep);
    result["decisions"] = verity::DecisionsToJson(decisions);
  }

  shutdown.RestoreSignalHandlers();
  detector->Close();

  if (!s.ok()) {
    std::cerr << cmd << " failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << verity::WritePrettyJson(result) << "\n";
  return 0;
}
