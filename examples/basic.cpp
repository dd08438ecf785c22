#include <verity/detector.hpp>

#include <iostream>

int main() {
  verity::Options opt;
  opt.similarity_threshold = 0.5;
  opt.db_path = "./verity_db";

  std::unique_ptr<verity::Detector> detector;
  auto s = verity::Detector::Open(opt, &detector);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  const char* nda =
      "MUTUAL NON-DISCLOSURE AGREEMENT\n\n"
      "This Agreement is entered into by and between Acme Corp and Beta LLC.\n"
      "WHEREAS the parties wish to exchange confidential information;\n\n"
      "1. Definitions. \"Confidential Information\" means any non-public data.\n"
      "2. Term. This Agreement remains in effect for two (2) years.\n\n"
      "Signature: ____________  Date: January 5, 2024\n";
  const char* nda_v2 =
      "MUTUAL NON-DISCLOSURE AGREEMENT\n\n"
      "This Agreement is entered into by and between Acme Corp and Beta LLC.\n"
      "WHEREAS the parties wish to exchange confidential information;\n\n"
      "1. Definitions. \"Confidential Information\" means any non-public data.\n"
      "2. Term. This Agreement remains in effect for three (3) years.\n\n"
      "Signature: ____________  Date: March 1, 2024\n";

  Json::Value meta;
  meta["type"] = "nda";

  s = detector->CreateFingerprint("nda-2024-01", nda, meta);
  if (!s.ok()) std::cerr << "Fingerprint nda-2024-01 failed: " << s.ToString() << "\n";

  // Same text up to whitespace: an exact duplicate.
  s = detector->CreateFingerprint("nda-copy", std::string(nda) + "\n\n", meta);
  if (!s.ok()) std::cerr << "Fingerprint nda-copy failed: " << s.ToString() << "\n";

  s = detector->CreateFingerprint("nda-2024-03", nda_v2, meta);
  if (!s.ok()) std::cerr << "Fingerprint nda-2024-03 failed: " << s.ToString() << "\n";

  std::vector<verity::DuplicateMatch> matches;
  s = detector->BatchDetectDuplicates(nullptr, &matches);
  if (!s.ok()) {
    std::cerr << "Batch failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& m : matches) {
    std::cout << m.document_id_1 << " ~ " << m.document_id_2 << " "
              << verity::DuplicateTypeName(m.duplicate_type) << " score=" << m.similarity_score
              << " via " << verity::SimilarityMethodName(m.method_used) << "\n";
  }

  std::vector<std::string> keep;
  std::vector<verity::DedupDecision> decisions;
  s = detector->RemoveDuplicates(nullptr, verity::KeepStrategy::kNewest, &keep, &decisions);
  if (!s.ok()) {
    std::cerr << "Dedup failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& d : decisions) {
    std::cout << "keep " << d.keeper << ", drop " << d.dropped.size() << "\n";
  }

  std::cout << "done\n";
  return 0;
}
