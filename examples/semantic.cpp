// Semantic similarity example for verity
//
// Paraphrased clauses share little wording, so only the embedding signal
// links them. Build with: cmake -DVERITY_ENABLE_SEMANTIC=ON ..
//
// Before running, export a sentence encoder to ONNX (vocab.txt must sit next
// to model.onnx):
//   optimum-cli export onnx --model sentence-transformers/all-MiniLM-L6-v2 \
//       --task feature-extraction ./minilm_onnx/

#include <verity/detector.hpp>
#include <verity/json.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <path-to-onnx-model>\n";
    std::cerr << "\nExample:\n";
    std::cerr << "  " << argv[0] << " ./minilm_onnx/model.onnx\n";
    return 1;
  }

  verity::Options opt;
  opt.semantic_model_path = argv[1];
  opt.semantic_model_type = verity::EmbedderModelType::kMiniLM;
  opt.similarity_threshold = 0.4;

  // Only pairs proposed by the HNSW index reach the comparator.
  opt.use_candidate_index = true;
  opt.candidate_k = 3;
  opt.hnsw_m = 16;
  opt.hnsw_ef_construction = 200;
  opt.hnsw_ef_search = 50;

  std::unique_ptr<verity::Detector> detector;
  auto s = verity::Detector::Open(opt, &detector);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  const std::vector<std::pair<std::string, std::string>> clauses = {
      {"indemnity-a",
       "The Supplier shall indemnify the Customer against all losses arising from "
       "any breach of this Agreement."},
      {"indemnity-b",
       "Any loss the Customer suffers because the Supplier breaks this contract "
       "will be made good by the Supplier."},
      {"termination",
       "Either party may terminate this Agreement on thirty days written notice."},
      {"payment", "Invoices are payable within forty-five days of receipt."},
  };

  for (const auto& [id, text] : clauses) {
    s = detector->CreateFingerprint(id, text);
    if (!s.ok()) {
      std::cerr << "Fingerprint " << id << " failed: " << s.ToString() << "\n";
      return 1;
    }
  }

  std::vector<verity::DuplicateMatch> matches;
  s = detector->BatchDetectDuplicates(nullptr, &matches);
  if (!s.ok()) {
    std::cerr << "Batch detection failed: " << s.ToString() << "\n";
    return 1;
  }

  std::cout << "Matches at threshold " << opt.similarity_threshold << ":\n";
  for (const auto& m : matches) {
    std::cout << "  " << m.document_id_1 << " ~ " << m.document_id_2 << "  "
              << verity::DuplicateTypeName(m.duplicate_type) << "  score "
              << m.similarity_score << "  semantic " << m.details.scores.semantic
              << "  tfidf " << m.details.scores.tfidf << "\n";
  }
  if (matches.empty()) {
    std::cout << "  (none) Try lowering the threshold.\n";
  }

  std::cout << "\nStatistics:\n"
            << verity::WritePrettyJson(verity::StatisticsToJson(detector->GetStatistics()))
            << "\n";
  return 0;
}
