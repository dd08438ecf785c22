// Performance benchmarks for verity fingerprinting and comparison
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: single signals (hashing, normalization, features, TF-IDF)
// 2. MACROBENCHMARKS: whole-detector operations over a synthetic corpus
//
// Corpus texts are generated before timing starts and are reproducible.

#include <benchmark/benchmark.h>

#include <verity/comparator.hpp>
#include <verity/detector.hpp>
#include <verity/features.hpp>
#include <verity/fingerprint.hpp>
#include <verity/internal.hpp>
#include <verity/normalize.hpp>
#include <verity/tfidf.hpp>

#include <random>
#include <string>
#include <vector>

namespace {

// =============================================================================
// Corpus Helpers
// =============================================================================

const std::vector<std::string>& Clauses() {
  static const std::vector<std::string> clauses = {
      "WHEREAS the Parties wish to set out the terms of their cooperation;",
      "1. Confidentiality. Each Party shall keep the Confidential Information secret.",
      "2. Term. This Agreement shall remain in force for a period of two (2) years.",
      "3. Governing Law. This Agreement is governed by the laws of the State of Delaware.",
      "4. Payment. The Buyer shall pay the Purchase Price within thirty (30) days.",
      "5. Termination. Either Party may terminate upon written notice, see 12 U.S.C. 1841.",
      "6. Assignment. Neither Party may assign this Agreement without prior consent.",
      "7. Notices. All notices shall be in writing and delivered to the addresses below.",
      "8. Indemnity. The Seller shall indemnify the Buyer against third party claims.",
      "9. Entire Agreement. This document is the \"entire agreement\" of the Parties.",
  };
  return clauses;
}

// A legal-looking document assembled from `clauses` random clauses.
std::string MakeDocument(std::mt19937* gen, size_t clauses) {
  std::uniform_int_distribution<size_t> pick(0, Clauses().size() - 1);
  std::string text = "AGREEMENT\n\nThis Agreement is made by and between the Parties.\n\n";
  for (size_t i = 0; i < clauses; ++i) {
    text += Clauses()[pick(*gen)];
    text += (i % 3 == 2) ? "\n\n" : "\n";
  }
  text += "\nSignature: ________  Date: 2024-01-15\n";
  return text;
}

std::vector<std::string> MakeCorpus(size_t documents, size_t clauses) {
  std::mt19937 gen(42);
  std::vector<std::string> corpus;
  corpus.reserve(documents);
  for (size_t i = 0; i < documents; ++i) corpus.push_back(MakeDocument(&gen, clauses));
  return corpus;
}

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_ContentHash(benchmark::State& state) {
  std::mt19937 gen(7);
  const std::string text = MakeDocument(&gen, static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto digest =
        verity::FingerprintBuilder::ContentHash(text, verity::NormalizationMode::kLowercase);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ContentHash)->Range(8, 1024);

static void BM_FuzzyHash(benchmark::State& state) {
  std::mt19937 gen(7);
  const std::string text = MakeDocument(&gen, static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto digest = verity::FingerprintBuilder::FuzzyHash(text);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_FuzzyHash)->Range(8, 1024);

static void BM_StructuralFeatures(benchmark::State& state) {
  std::mt19937 gen(7);
  const std::string text = MakeDocument(&gen, static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto features = verity::ExtractStructuralFeatures(text);
    benchmark::DoNotOptimize(features);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_StructuralFeatures)->Range(8, 1024);

static void BM_TfidfTransform(benchmark::State& state) {
  const auto corpus = MakeCorpus(200, 20);
  verity::TfidfVectorizer vectorizer;
  if (!vectorizer.Fit(corpus).ok()) {
    state.SkipWithError("fit failed");
    return;
  }
  size_t i = 0;
  for (auto _ : state) {
    auto v = vectorizer.Transform(corpus[i++ % corpus.size()]);
    benchmark::DoNotOptimize(v);
  }
}
BENCHMARK(BM_TfidfTransform);

static void BM_ComparatorCompare(benchmark::State& state) {
  const auto corpus = MakeCorpus(64, 20);
  verity::TfidfVectorizer vectorizer;
  if (!vectorizer.Fit(corpus).ok()) {
    state.SkipWithError("fit failed");
    return;
  }
  verity::FingerprintBuilder builder(verity::FingerprintBuilder::Config{}, &vectorizer);
  std::vector<std::shared_ptr<verity::DocumentFingerprint>> fps(corpus.size());
  for (size_t i = 0; i < corpus.size(); ++i) {
    if (!builder.Build("doc" + std::to_string(i), corpus[i], Json::Value(), {}, &fps[i]).ok()) {
      state.SkipWithError("build failed");
      return;
    }
  }

  size_t i = 0;
  for (auto _ : state) {
    const auto& a = *fps[i % fps.size()];
    const auto& b = *fps[(i * 7 + 1) % fps.size()];
    auto m = verity::Comparator::Compare(a, b, 0);
    benchmark::DoNotOptimize(m);
    ++i;
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComparatorCompare);

// =============================================================================
// PART 2: MACROBENCHMARKS
// =============================================================================

// Whole-corpus sweep; range(0) = documents, range(1) = comparison threads.
// The cache is cleared each iteration so every pair is scored.
static void BM_BatchDetect(benchmark::State& state) {
  const auto corpus = MakeCorpus(static_cast<size_t>(state.range(0)), 20);

  verity::Options opt;
  opt.similarity_threshold = 0.8;
  opt.comparison_threads = static_cast<int>(state.range(1));
  std::unique_ptr<verity::Detector> detector;
  if (!verity::Detector::Open(opt, &detector).ok() || !detector->FitVocabulary(corpus).ok()) {
    state.SkipWithError("open failed");
    return;
  }
  for (size_t i = 0; i < corpus.size(); ++i) {
    if (!detector->CreateFingerprint("doc" + std::to_string(i), corpus[i]).ok()) {
      state.SkipWithError("fingerprint failed");
      return;
    }
  }

  std::vector<verity::DuplicateMatch> matches;
  for (auto _ : state) {
    state.PauseTiming();
    detector->ClearCache();
    state.ResumeTiming();
    auto s = detector->BatchDetectDuplicates(nullptr, &matches);
    benchmark::DoNotOptimize(s);
  }
  const int64_t n = state.range(0);
  state.SetItemsProcessed(state.iterations() * n * (n - 1) / 2);
}
BENCHMARK(BM_BatchDetect)
    ->Args({100, 1})
    ->Args({100, 4})
    ->Args({400, 1})
    ->Args({400, 4})
    ->Unit(benchmark::kMillisecond);

// Same sweep answered from a warm comparison cache.
static void BM_BatchDetectCached(benchmark::State& state) {
  const auto corpus = MakeCorpus(static_cast<size_t>(state.range(0)), 20);

  verity::Options opt;
  std::unique_ptr<verity::Detector> detector;
  if (!verity::Detector::Open(opt, &detector).ok() || !detector->FitVocabulary(corpus).ok()) {
    state.SkipWithError("open failed");
    return;
  }
  for (size_t i = 0; i < corpus.size(); ++i) {
    if (!detector->CreateFingerprint("doc" + std::to_string(i), corpus[i]).ok()) {
      state.SkipWithError("fingerprint failed");
      return;
    }
  }

  std::vector<verity::DuplicateMatch> matches;
  if (!detector->BatchDetectDuplicates(nullptr, &matches).ok()) {
    state.SkipWithError("warm-up failed");
    return;
  }
  for (auto _ : state) {
    auto s = detector->BatchDetectDuplicates(nullptr, &matches);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK(BM_BatchDetectCached)->Arg(100)->Arg(400)->Unit(benchmark::kMillisecond);

}  // namespace

BENCHMARK_MAIN();
