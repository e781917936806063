// Performance benchmarks for condense
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: single-note and pairwise operations
//    - normalization, concept extraction, SHA-256, edit distance, scoring
// 2. MACROBENCHMARKS: full pipeline runs over synthetic episodes
//    - varying note count and thread count
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use a fixed seed so datasets are reproducible

#include <benchmark/benchmark.h>

#include <condense/internal.hpp>
#include <condense/lexicon.hpp>
#include <condense/normalize.hpp>
#include <condense/pipeline.hpp>
#include <condense/similarity.hpp>

#include <random>
#include <string>
#include <vector>

namespace {

// =============================================================================
// Synthetic Notes
// =============================================================================

const std::vector<std::string>& Sentences() {
  static const std::vector<std::string> sentences = {
      "Patient developed vasospasm on POD 3.",
      "Neuro exam stable without new deficit.",
      "Continue nimodipine and levetiracetam.",
      "Head CT shows stable hydrocephalus, EVD open at 10 cm.",
      "Afebrile overnight, tolerating diet.",
      "Ambulating with PT, wound clean and dry.",
      "MRI brain shows left frontal glioblastoma with edema.",
      "Family meeting held; discussed discharge planning to rehab facility.",
      "Keppra 500 mg BID for seizure prophylaxis.",
      "TCD velocities elevated in the left MCA.",
      "S/p right pterional craniotomy for clipping of ACOMM aneurysm.",
      "Pain controlled with acetaminophen and oxycodone.",
  };
  return sentences;
}

std::vector<condense::NoteInput> MakeEpisode(size_t notes, uint32_t seed) {
  std::mt19937 gen(seed);
  const auto& pool = Sentences();
  std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
  std::uniform_int_distribution<size_t> count(2, 5);
  static const char* kRoles[] = {"attending", "resident", "consult", "PT", "Op Note", ""};
  std::uniform_int_distribution<size_t> role(0, 5);

  std::vector<condense::NoteInput> out;
  out.reserve(notes);
  for (size_t i = 0; i < notes; ++i) {
    std::string text;
    const size_t n = count(gen);
    for (size_t k = 0; k < n; ++k) {
      if (!text.empty()) text += ' ';
      text += pool[pick(gen)];
    }
    out.emplace_back(std::move(text), kRoles[role(gen)]);
  }
  return out;
}

std::string LongNote(size_t bytes) {
  std::string text;
  size_t i = 0;
  const auto& pool = Sentences();
  while (text.size() < bytes) {
    text += pool[i++ % pool.size()];
    text += ' ';
  }
  text.resize(bytes);
  return text;
}

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_SHA256_Fingerprint(benchmark::State& state) {
  std::string data(state.range(0), 'x');
  for (auto _ : state) {
    auto fp = condense::internal::Fingerprint(data);
    benchmark::DoNotOptimize(fp);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SHA256_Fingerprint)->Range(64, 1 << 16);

static void BM_NormalizeNote(benchmark::State& state) {
  const std::string input = LongNote(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto result = condense::NormalizeNote(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_NormalizeNote)->Range(64, 1 << 16);

static void BM_ConceptExtract(benchmark::State& state) {
  const auto normalized = condense::NormalizeNote(LongNote(static_cast<size_t>(state.range(0))));
  auto lexicon = condense::DefaultConceptLexicon();
  for (auto _ : state) {
    auto concepts = lexicon->Extract(normalized.text);
    benchmark::DoNotOptimize(concepts);
  }
  state.SetBytesProcessed(state.iterations() * normalized.text.size());
}
BENCHMARK(BM_ConceptExtract)->Range(64, 1 << 14);

static void BM_LevenshteinSimilarity(benchmark::State& state) {
  const std::string a = condense::NormalizeNote(LongNote(state.range(0))).text;
  std::string b = a;
  for (size_t i = 0; i < b.size(); i += 7) b[i] = 'z';
  for (auto _ : state) {
    double s = condense::LevenshteinSimilarity(a, b, 4096);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK(BM_LevenshteinSimilarity)->Range(64, 4096);

static void BM_Score_Pair(benchmark::State& state) {
  condense::SimilarityScorer scorer;
  const auto a = condense::NormalizeNote(LongNote(state.range(0)));
  const auto b = condense::NormalizeNote(LongNote(state.range(0) + 40));
  const auto ca = scorer.Concepts(a);
  const auto cb = scorer.Concepts(b);
  for (auto _ : state) {
    auto s = scorer.Score(a, ca, b, cb);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK(BM_Score_Pair)->Range(64, 4096);

// =============================================================================
// PART 2: MACROBENCHMARKS
// =============================================================================

static void BM_Pipeline_Run(benchmark::State& state) {
  const auto inputs = MakeEpisode(static_cast<size_t>(state.range(0)), 42);
  condense::Options opt;
  opt.num_threads = static_cast<size_t>(state.range(1));
  std::unique_ptr<condense::Pipeline> pipeline;
  auto s = condense::Pipeline::Create(&pipeline, opt);
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }

  for (auto _ : state) {
    condense::DeduplicationResult result;
    auto st = pipeline->Run(inputs, &result);
    benchmark::DoNotOptimize(st);
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Pipeline_Run)
    ->Args({10, 1})
    ->Args({50, 1})
    ->Args({200, 1})
    ->Args({200, 4})
    ->Unit(benchmark::kMillisecond);

}  // namespace

BENCHMARK_MAIN();
