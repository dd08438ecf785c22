// Performance benchmarks for fingerprint persistence
//
// Organization:
// 1. MICROBENCHMARKS: fingerprint codec (no I/O)
// 2. MACROBENCHMARKS: FingerprintStore writes and full loads, detector reopen
//
// Fingerprints are built once, outside the timing loops.

#include <benchmark/benchmark.h>

#include <verity/detector.hpp>
#include <verity/fingerprint.hpp>
#include <verity/fingerprint_store.hpp>

#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

// =============================================================================
// Benchmark Fixtures and Helpers
// =============================================================================

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// A contract of `paragraphs` paragraphs with a per-document party name.
std::string MakeContract(size_t index, size_t paragraphs) {
  std::string text = "SERVICES AGREEMENT\n\nThis Agreement is made between Provider and Client " +
                     std::to_string(index) + ".\n\n";
  for (size_t p = 0; p < paragraphs; ++p) {
    text += std::to_string(p + 1) + ". The Provider shall perform the services described in "
            "Schedule " + std::to_string(p) + " with reasonable skill and care.\n\n";
  }
  text += "Signed by the parties.\n";
  return text;
}

std::vector<std::shared_ptr<verity::DocumentFingerprint>> MakeFingerprints(size_t count,
                                                                           size_t dimension) {
  verity::TfidfVectorizer vectorizer;
  verity::FingerprintBuilder builder(verity::FingerprintBuilder::Config{}, &vectorizer);

  std::mt19937 gen(7);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<std::shared_ptr<verity::DocumentFingerprint>> out;
  for (size_t i = 0; i < count; ++i) {
    std::shared_ptr<verity::DocumentFingerprint> fp;
    auto s = builder.Build("doc-" + std::to_string(i), MakeContract(i, 12), Json::Value(), "",
                           &fp);
    if (!s.ok()) continue;
    if (dimension > 0) {
      std::vector<float> v(dimension);
      for (float& x : v) x = dist(gen);
      fp->semantic_vector = std::move(v);
    }
    out.push_back(std::move(fp));
  }
  return out;
}

class StoreBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    (void)state;
    test_dir_ = std::filesystem::temp_directory_path() / ("verity_bench_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "bench_db").string();
  }

  void TearDown(const benchmark::State& state) override {
    (void)state;
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<verity::FingerprintStore> store_;
};

// =============================================================================
// PART 1: MICROBENCHMARKS - fingerprint codec
// =============================================================================

static void BM_EncodeFingerprint(benchmark::State& state) {
  auto fps = MakeFingerprints(1, static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    std::string bytes = verity::internal::EncodeFingerprint(*fps[0]);
    benchmark::DoNotOptimize(bytes);
  }
}
BENCHMARK(BM_EncodeFingerprint)->Arg(0)->Arg(384)->Arg(1024);

static void BM_DecodeFingerprint(benchmark::State& state) {
  auto fps = MakeFingerprints(1, static_cast<size_t>(state.range(0)));
  const std::string bytes = verity::internal::EncodeFingerprint(*fps[0]);
  for (auto _ : state) {
    verity::DocumentFingerprint fp;
    bool ok = verity::internal::DecodeFingerprint(bytes, &fp);
    benchmark::DoNotOptimize(ok);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes.size()));
}
BENCHMARK(BM_DecodeFingerprint)->Arg(0)->Arg(384)->Arg(1024);

// =============================================================================
// PART 2: MACROBENCHMARKS - RocksDB I/O
// =============================================================================

BENCHMARK_DEFINE_F(StoreBenchmark, Put)(benchmark::State& state) {
  if (!verity::FingerprintStore::Open(db_path_, &store_).ok()) {
    state.SkipWithError("cannot open store");
    return;
  }
  auto fps = MakeFingerprints(256, 384);
  size_t i = 0;
  for (auto _ : state) {
    auto s = store_->Put(*fps[i++ % fps.size()]);
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(StoreBenchmark, Put);

BENCHMARK_DEFINE_F(StoreBenchmark, LoadAll)(benchmark::State& state) {
  if (!verity::FingerprintStore::Open(db_path_, &store_).ok()) {
    state.SkipWithError("cannot open store");
    return;
  }
  for (const auto& fp : MakeFingerprints(static_cast<size_t>(state.range(0)), 384)) {
    if (!store_->Put(*fp).ok()) {
      state.SkipWithError("put failed");
      return;
    }
  }
  for (auto _ : state) {
    std::vector<std::shared_ptr<verity::DocumentFingerprint>> loaded;
    auto s = store_->LoadAll(&loaded);
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(StoreBenchmark, LoadAll)->Arg(100)->Arg(1000)->Unit(benchmark::kMillisecond);

// Detector::Open on an existing database: vocabulary decode plus registry load.
BENCHMARK_DEFINE_F(StoreBenchmark, DetectorReopen)(benchmark::State& state) {
  verity::Options opt;
  opt.db_path = db_path_;
  {
    std::unique_ptr<verity::Detector> detector;
    if (!verity::Detector::Open(opt, &detector).ok()) {
      state.SkipWithError("cannot open detector");
      return;
    }
    for (int64_t i = 0; i < state.range(0); ++i) {
      if (!detector->CreateFingerprint("doc-" + std::to_string(i),
                                       MakeContract(static_cast<size_t>(i), 8))
               .ok()) {
        state.SkipWithError("fingerprint failed");
        return;
      }
    }
  }

  for (auto _ : state) {
    std::unique_ptr<verity::Detector> detector;
    auto s = verity::Detector::Open(opt, &detector);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(StoreBenchmark, DetectorReopen)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(benchmark::kMillisecond);

}  // namespace
