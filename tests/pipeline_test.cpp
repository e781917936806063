// Unit tests for condense/pipeline.hpp
// Tests: end-to-end scenarios, ingestion, ordering, failure isolation,
// deadlines, observability hooks, determinism, option validation

#include <gtest/gtest.h>

#include <condense/pipeline.hpp>
#include <condense/test_utils.hpp>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace condense {
namespace {

using condense::testing::MakeInput;
using condense::testing::MakeInputs;

const char* kAttending =
    "Patient is POD 2 s/p right pterional craniotomy for clipping of MCA aneurysm. "
    "Neuro exam stable without new deficit. Continue nimodipine and levetiracetam.";
const char* kResident =
    "POD 2 s/p right craniotomy for MCA aneurysm clipping. "
    "Neuro exam stable without new deficit. Started nimodipine 60 mg q4h.";
const char* kNeurology =
    "EEG showed no seizure activity. Recommend continuing levetiracetam 500 mg BID.";
const char* kTherapy = "Neuro exam stable without new deficit.";

// One post-operative day as charted by several services.
std::vector<NoteInput> Episode() {
  return {
      MakeInput("att-1", kAttending, "attending"),
      MakeInput("res-1", kResident, "resident"),
      MakeInput("neuro-1", kNeurology, "consultant"),
      MakeInput("pt-1", kTherapy, "PT"),
      MakeInput("att-1-copy", kAttending, "attending"),
  };
}

class PipelineTest : public ::testing::Test {
 protected:
  std::unique_ptr<Pipeline> Open(const Options& opt = Options{}) {
    std::unique_ptr<Pipeline> p;
    auto s = Pipeline::Create(&p, opt);
    EXPECT_TRUE(s.ok()) << s.ToString();
    return p;
  }

  DeduplicationResult RunOk(const Pipeline& p, const std::vector<NoteInput>& inputs) {
    DeduplicationResult result;
    auto s = p.Run(inputs, &result);
    EXPECT_TRUE(s.ok()) << s.ToString();
    return result;
  }

  static const ResultNote* Find(const DeduplicationResult& r, const std::string& id) {
    for (const auto& n : r.notes) {
      if (n.id == id) return &n;
    }
    return nullptr;
  }
};

// =============================================================================
// Scenarios
// =============================================================================

TEST_F(PipelineTest, ExactDuplicatesHalve) {
  auto p = Open();
  auto r = RunOk(*p, MakeInputs({"Continue nimodipine.", "Continue nimodipine."}));
  EXPECT_EQ(r.input_count, 2u);
  EXPECT_EQ(r.output_count, 1u);
  EXPECT_DOUBLE_EQ(r.reduction_percent, 50.0);
  EXPECT_EQ(r.phase_stats.exact_removed, 1u);
  ASSERT_EQ(r.notes.size(), 1u);
  EXPECT_EQ(r.notes[0].provenance, (std::vector<std::string>{"note-0", "note-1"}));
  EXPECT_FALSE(r.partial);
}

TEST_F(PipelineTest, AbbreviationVariantsCluster) {
  auto p = Open();
  auto r = RunOk(*p, {MakeInput("a", "Patient developed vasospasm on POD 3."),
                      MakeInput("b", "Pt developed vasospasm POD#3.", "attending")});
  ASSERT_EQ(r.notes.size(), 1u);
  EXPECT_EQ(r.notes[0].id, "b");
  EXPECT_EQ(r.notes[0].source_role, SourceRole::kAttending);
  EXPECT_EQ(r.notes[0].provenance, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(r.phase_stats.near_removed, 1u);
  ASSERT_EQ(r.cluster_count, 1u);
  EXPECT_EQ(r.clusters[0].representative_note_id, "b");
  EXPECT_EQ(r.clusters[0].member_note_ids, (std::vector<std::string>{"a", "b"}));
}

TEST_F(PipelineTest, SameDayNotesMerge) {
  auto p = Open();
  auto r = RunOk(*p, MakeInputs({"POD 3: patient afebrile, tolerating diet.",
                                 "POD 3: ambulating with PT, wound clean."}));
  ASSERT_EQ(r.notes.size(), 1u);
  EXPECT_EQ(r.notes[0].text,
            "POD 3: patient afebrile, tolerating diet. POD 3: ambulating with PT, wound clean.");
  EXPECT_TRUE(r.notes[0].merged);
  EXPECT_TRUE(r.notes[0].modified);
  EXPECT_EQ(r.phase_stats.merged, 1u);
  EXPECT_EQ(r.phase_stats.sentences_removed, 0u);
  // Clusters reflect the near phase; the merge does not touch them.
  EXPECT_EQ(r.cluster_count, 2u);
}

TEST_F(PipelineTest, UnrelatedNotesPassThrough) {
  const std::vector<std::string> texts = {
      "MRI brain shows left frontal glioblastoma with edema.",
      "Family meeting held; discussed discharge planning to rehab facility."};
  auto p = Open();
  auto r = RunOk(*p, MakeInputs(texts));
  ASSERT_EQ(r.notes.size(), 2u);
  for (size_t i = 0; i < 2; ++i) {
    EXPECT_EQ(r.notes[i].text, texts[i]);
    EXPECT_FALSE(r.notes[i].modified);
    EXPECT_FALSE(r.notes[i].merged);
  }
  EXPECT_EQ(r.cluster_count, 2u);
  EXPECT_DOUBLE_EQ(r.reduction_percent, 0.0);
  EXPECT_EQ(r.phase_stats.phases_completed, 4u);
}

TEST_F(PipelineTest, FullEpisode) {
  auto p = Open();
  auto r = RunOk(*p, Episode());

  EXPECT_EQ(r.input_count, 5u);
  EXPECT_EQ(r.output_count, 2u);
  EXPECT_DOUBLE_EQ(r.reduction_percent, 60.0);
  EXPECT_EQ(r.phase_stats.exact_removed, 1u);
  EXPECT_EQ(r.phase_stats.near_removed, 0u);
  EXPECT_EQ(r.phase_stats.sentences_removed, 2u);
  EXPECT_EQ(r.phase_stats.notes_emptied, 1u);
  EXPECT_EQ(r.phase_stats.merged, 1u);
  EXPECT_EQ(r.cluster_count, 4u);
  EXPECT_TRUE(r.phase_stats.errors.empty());

  ASSERT_EQ(r.notes.size(), 2u);
  const auto& att = r.notes[0];
  EXPECT_EQ(att.id, "att-1");
  EXPECT_EQ(att.source_role, SourceRole::kAttending);
  EXPECT_EQ(att.provenance,
            (std::vector<std::string>{"att-1", "res-1", "pt-1", "att-1-copy"}));
  EXPECT_TRUE(att.merged);
  EXPECT_TRUE(att.modified);
  EXPECT_EQ(att.text,
            std::string(kAttending) +
                " POD 2 s/p right craniotomy for MCA aneurysm clipping. "
                "Started nimodipine 60 mg q4h.");

  const auto& neuro = r.notes[1];
  EXPECT_EQ(neuro.id, "neuro-1");
  EXPECT_EQ(neuro.text, kNeurology);
  EXPECT_EQ(neuro.provenance, (std::vector<std::string>{"neuro-1"}));
  EXPECT_FALSE(neuro.modified);
}

TEST_F(PipelineTest, RerunningOutputChangesNothing) {
  auto p = Open();
  auto first = RunOk(*p, Episode());
  auto second = RunOk(*p, NoteInputsFromResult(first));

  EXPECT_EQ(second.output_count, first.output_count);
  EXPECT_DOUBLE_EQ(second.reduction_percent, 0.0);
  ASSERT_EQ(second.notes.size(), first.notes.size());
  for (size_t i = 0; i < first.notes.size(); ++i) {
    EXPECT_EQ(second.notes[i].id, first.notes[i].id);
    EXPECT_EQ(second.notes[i].text, first.notes[i].text);
    EXPECT_EQ(second.notes[i].source_role, first.notes[i].source_role);
    EXPECT_FALSE(second.notes[i].modified);
  }
}

TEST_F(PipelineTest, RerunKeepsOrderWhenLaterNoteRepresentsCluster) {
  auto p = Open();
  auto first = RunOk(*p, MakeInputs({"CT head showed no new hemorrhage.",
                                      "Neuro exam stable without new deficit.",
                                      "CT head showed no new hemorrhage. "
                                      "CT head showed no new hemorrhage."}));
  ASSERT_EQ(first.notes.size(), 2u);
  EXPECT_EQ(first.notes[0].id, "note-2");
  EXPECT_EQ(first.notes[0].sequence_index, 2);
  EXPECT_EQ(first.notes[0].earliest_sequence_index, 0);
  EXPECT_EQ(first.notes[1].id, "note-1");

  auto inputs = NoteInputsFromResult(first);
  EXPECT_EQ(*inputs[0].sequence_index, 0);

  auto second = RunOk(*p, inputs);
  ASSERT_EQ(second.notes.size(), 2u);
  EXPECT_EQ(second.notes[0].id, "note-2");
  EXPECT_EQ(second.notes[1].id, "note-1");
  EXPECT_EQ(second.notes[0].text, first.notes[0].text);
}

TEST_F(PipelineTest, ConceptFreeParaphrasesAreNotClustered) {
  const std::string a = "Family meeting held with wife at bedside today.";
  const std::string b = "Family meeting held with the wife at bedside today.";

  Options opt;
  opt.merge_complementary = false;
  auto p = Open(opt);

  // Without lexicon concepts the semantic component is zero, which caps the
  // combined score at jaccard + levenshtein weight.
  auto score = p->Similarity(a, b);
  EXPECT_DOUBLE_EQ(score.semantic, 0.0);
  EXPECT_LT(score.combined, 0.6);

  auto r = RunOk(*p, MakeInputs({a, b}));
  EXPECT_EQ(r.output_count, 2u);
  EXPECT_EQ(r.cluster_count, 2u);
  EXPECT_EQ(r.phase_stats.near_removed, 0u);
  EXPECT_EQ(r.phase_stats.sentences_removed, 0u);

  // The merge phase still folds them together as same-day notes.
  auto merged = RunOk(*Open(), MakeInputs({a, b}));
  ASSERT_EQ(merged.notes.size(), 1u);
  EXPECT_TRUE(merged.notes[0].merged);
}

// =============================================================================
// Ingestion
// =============================================================================

TEST_F(PipelineTest, EmptyInput) {
  auto p = Open();
  auto r = RunOk(*p, {});
  EXPECT_EQ(r.input_count, 0u);
  EXPECT_EQ(r.output_count, 0u);
  EXPECT_DOUBLE_EQ(r.reduction_percent, 0.0);
  EXPECT_EQ(r.cluster_count, 0u);
  EXPECT_FALSE(r.partial);
}

TEST_F(PipelineTest, InputsWithoutTextAreSkipped) {
  auto p = Open();
  std::vector<NoteInput> inputs = MakeInputs({"Continue nimodipine."});
  NoteInput missing;
  missing.id = "ghost";
  missing.role = "attending";
  inputs.push_back(missing);

  auto r = RunOk(*p, inputs);
  EXPECT_EQ(r.phase_stats.skipped_inputs, 1u);
  EXPECT_EQ(r.input_count, 1u);
  EXPECT_EQ(r.output_count, 1u);
  EXPECT_EQ(Find(r, "ghost"), nullptr);
}

TEST_F(PipelineTest, EmptyTextIsANote) {
  auto p = Open();
  auto r = RunOk(*p, MakeInputs({"", "Continue nimodipine."}));
  EXPECT_EQ(r.phase_stats.skipped_inputs, 0u);
  EXPECT_EQ(r.input_count, 2u);
  EXPECT_EQ(r.output_count, 2u);
}

TEST_F(PipelineTest, DuplicateIdsAreMadeUnique) {
  auto p = Open();
  auto r = RunOk(*p, {MakeInput("x", "MRI brain shows left frontal glioblastoma with edema."),
                      MakeInput("x", "Family meeting held; discussed discharge planning.")});
  ASSERT_EQ(r.notes.size(), 2u);
  EXPECT_EQ(r.notes[0].id, "x");
  EXPECT_EQ(r.notes[1].id, "x#1");
}

TEST_F(PipelineTest, DefaultIdsAndSequence) {
  auto p = Open();
  NoteInput late("Continue Keppra.");
  late.sequence_index = 5;
  NoteInput early("Family meeting held.");
  early.sequence_index = 2;
  auto r = RunOk(*p, {late, early});
  ASSERT_EQ(r.notes.size(), 2u);
  EXPECT_EQ(r.notes[0].id, "note-1");
  EXPECT_EQ(r.notes[0].sequence_index, 2);
  EXPECT_EQ(r.notes[1].id, "note-0");
  EXPECT_EQ(r.notes[1].sequence_index, 5);
}

TEST_F(PipelineTest, RoleLabelsResolvedOnce) {
  auto p = Open();
  auto r = RunOk(*p, {MakeInput("a", "Continue Keppra.", "PT consult"),
                      MakeInput("b", "Family meeting held.", "Brief Op Note"),
                      MakeInput("c", "MRI brain unchanged.")});
  EXPECT_EQ(Find(r, "a")->source_role, SourceRole::kPtOt);
  EXPECT_EQ(Find(r, "b")->source_role, SourceRole::kOperative);
  EXPECT_EQ(Find(r, "c")->source_role, SourceRole::kUnknown);
}

// =============================================================================
// Ordering
// =============================================================================

std::vector<NoteInput> LateRepresentative() {
  return {MakeInput("res", "Patient developed vasospasm on POD 3.", "resident"),
          MakeInput("mri", "MRI brain shows left frontal glioblastoma with edema."),
          MakeInput("att", "Pt developed vasospasm POD#3.", "attending")};
}

TEST_F(PipelineTest, ChronologyFollowsEarliestInput) {
  auto p = Open();
  auto r = RunOk(*p, LateRepresentative());
  ASSERT_EQ(r.notes.size(), 2u);
  EXPECT_EQ(r.notes[0].id, "att");
  EXPECT_EQ(r.notes[0].sequence_index, 2);
  EXPECT_EQ(r.notes[0].earliest_sequence_index, 0);
  EXPECT_EQ(r.notes[1].id, "mri");
}

TEST_F(PipelineTest, WithoutChronologyRepresentativeOrder) {
  Options opt;
  opt.preserve_chronology = false;
  auto p = Open(opt);
  auto r = RunOk(*p, LateRepresentative());
  ASSERT_EQ(r.notes.size(), 2u);
  EXPECT_EQ(r.notes[0].id, "mri");
  EXPECT_EQ(r.notes[1].id, "att");
}

// =============================================================================
// Options
// =============================================================================

TEST_F(PipelineTest, MergeDisabled) {
  Options opt;
  opt.merge_complementary = false;
  auto p = Open(opt);
  auto r = RunOk(*p, MakeInputs({"POD 3: patient afebrile, tolerating diet.",
                                 "POD 3: ambulating with PT, wound clean."}));
  EXPECT_EQ(r.output_count, 2u);
  EXPECT_EQ(r.phase_stats.merged, 0u);
  EXPECT_EQ(r.phase_stats.phases_completed, 3u);
}

TEST_F(PipelineTest, ThreadCountDoesNotChangeOutput) {
  Options serial_opt;
  Options parallel_opt;
  parallel_opt.num_threads = 4;
  auto serial = RunOk(*Open(serial_opt), Episode());
  auto parallel = RunOk(*Open(parallel_opt), Episode());

  ASSERT_EQ(serial.notes.size(), parallel.notes.size());
  for (size_t i = 0; i < serial.notes.size(); ++i) {
    EXPECT_EQ(serial.notes[i].id, parallel.notes[i].id);
    EXPECT_EQ(serial.notes[i].text, parallel.notes[i].text);
    EXPECT_EQ(serial.notes[i].provenance, parallel.notes[i].provenance);
  }
  EXPECT_EQ(serial.cluster_count, parallel.cluster_count);
}

TEST_F(PipelineTest, ConcurrentRunsShareOnePipeline) {
  auto p = Open();
  const auto expected = RunOk(*p, Episode());

  std::vector<DeduplicationResult> results(4);
  std::vector<rocksdb::Status> statuses(results.size());
  std::vector<std::thread> threads;
  for (size_t t = 0; t < results.size(); ++t) {
    threads.emplace_back([&, t] { statuses[t] = p->Run(Episode(), &results[t]); });
  }
  for (auto& th : threads) th.join();

  for (const auto& s : statuses) EXPECT_TRUE(s.ok());
  for (const auto& r : results) {
    ASSERT_EQ(r.notes.size(), expected.notes.size());
    for (size_t i = 0; i < r.notes.size(); ++i) {
      EXPECT_EQ(r.notes[i].text, expected.notes[i].text);
    }
  }
}

TEST_F(PipelineTest, CreateRejectsBadOptions) {
  std::unique_ptr<Pipeline> p;
  EXPECT_TRUE(Pipeline::Create(nullptr, Options{}).IsInvalidArgument());

  Options opt;
  opt.weights.semantic = 0.9;
  EXPECT_TRUE(Pipeline::Create(&p, opt).IsInvalidArgument());

  opt = Options{};
  opt.threshold_near = 1.5;
  EXPECT_TRUE(Pipeline::Create(&p, opt).IsInvalidArgument());

  opt = Options{};
  opt.threshold_sentence = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(Pipeline::Create(&p, opt).IsInvalidArgument());

  opt = Options{};
  opt.complementary_low = 0.6;
  opt.complementary_high = 0.6;
  EXPECT_TRUE(Pipeline::Create(&p, opt).IsInvalidArgument());

  opt = Options{};
  opt.num_threads = 0;
  EXPECT_TRUE(Pipeline::Create(&p, opt).IsInvalidArgument());

  EXPECT_EQ(p, nullptr);
}

TEST_F(PipelineTest, RunNullOutput) {
  auto p = Open();
  EXPECT_TRUE(p->Run(MakeInputs({"x"}), nullptr).IsInvalidArgument());
}

TEST_F(PipelineTest, SimilarityUsesPipelineWeights) {
  auto p = Open();
  auto s = p->Similarity("Patient developed vasospasm on POD 3.", "Pt developed vasospasm POD#3.");
  EXPECT_NEAR(s.combined, 11.0 / 12.0, 1e-4);
}

// =============================================================================
// Failures and deadlines
// =============================================================================

TEST_F(PipelineTest, FailingPhasesArePassedThrough) {
  Options opt;
  opt.lexicon = std::make_shared<testing::ThrowingLexicon>();
  auto p = Open(opt);
  auto r = RunOk(*p, Episode());

  EXPECT_FALSE(r.partial);
  EXPECT_EQ(r.phase_stats.phases_completed, 1u);
  ASSERT_EQ(r.phase_stats.errors.size(), 3u);
  EXPECT_EQ(r.phase_stats.errors[0].phase, "near");
  EXPECT_EQ(r.phase_stats.errors[1].phase, "sentence");
  EXPECT_EQ(r.phase_stats.errors[2].phase, "merge");
  EXPECT_EQ(r.phase_stats.errors[0].message, "lexicon unavailable");

  // Only the exact phase took effect; every survivor is its own cluster.
  EXPECT_EQ(r.output_count, 4u);
  EXPECT_EQ(r.cluster_count, 4u);
  for (const auto& c : r.clusters) {
    EXPECT_EQ(c.member_note_ids, (std::vector<std::string>{c.representative_note_id}));
  }
  const auto* att = Find(r, "att-1");
  ASSERT_NE(att, nullptr);
  EXPECT_EQ(att->text, kAttending);
  EXPECT_FALSE(att->modified);
}

TEST_F(PipelineTest, ThrowingEntityCounterIsHarmless) {
  Options opt;
  opt.entity_counter = std::make_shared<testing::ThrowingEntityCounter>();
  auto r = RunOk(*Open(opt), Episode());
  EXPECT_TRUE(r.phase_stats.errors.empty());
  EXPECT_EQ(r.output_count, 2u);
}

TEST_F(PipelineTest, DeadlineYieldsPartialResult) {
  auto clock = std::make_shared<testing::FakeClock>();
  Options opt;
  opt.clock = clock;
  opt.lexicon = std::make_shared<testing::ClockAdvancingLexicon>(clock, 10);
  opt.timeout_ms = 5;
  auto p = Open(opt);
  auto r = RunOk(*p, Episode());

  EXPECT_TRUE(r.partial);
  EXPECT_EQ(r.phase_stats.phases_completed, 1u);
  EXPECT_EQ(r.phase_stats.exact_removed, 1u);
  EXPECT_TRUE(r.phase_stats.errors.empty());
  EXPECT_EQ(r.output_count, 4u);
  EXPECT_EQ(r.cluster_count, 4u);
  EXPECT_DOUBLE_EQ(r.reduction_percent, 20.0);
}

TEST_F(PipelineTest, NoDeadlineWithoutTimeout) {
  auto clock = std::make_shared<testing::FakeClock>();
  Options opt;
  opt.clock = clock;
  opt.lexicon = std::make_shared<testing::ClockAdvancingLexicon>(clock, 1000);
  auto r = RunOk(*Open(opt), Episode());
  EXPECT_FALSE(r.partial);
  EXPECT_EQ(r.phase_stats.phases_completed, 4u);
}

// =============================================================================
// Observability
// =============================================================================

TEST_F(PipelineTest, MetricsEmitted) {
  auto metrics = std::make_shared<testing::RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  auto p = Open(opt);
  RunOk(*p, Episode());

  EXPECT_EQ(metrics->CounterValue("condense.run.calls"), 1u);
  EXPECT_EQ(metrics->CounterValue("condense.phase.exact.removed_total"), 1u);
  EXPECT_EQ(metrics->CounterValue("condense.phase.sentence.removed_total"), 2u);
  EXPECT_EQ(metrics->CounterValue("condense.phase.merge.removed_total"), 1u);
  EXPECT_EQ(metrics->CounterValue("condense.run.partial_total"), 0u);
  EXPECT_EQ(metrics->HistogramCount("condense.run.latency_us"), 1u);
  for (const char* phase : {"exact", "near", "sentence", "merge"}) {
    EXPECT_EQ(metrics->HistogramCount(std::string("condense.phase.") + phase + ".latency_us"), 1u)
        << phase;
  }
  ASSERT_TRUE(metrics->HasGauge("condense.run.reduction_percent"));
  EXPECT_DOUBLE_EQ(metrics->GaugeValue("condense.run.reduction_percent"), 60.0);
}

TEST_F(PipelineTest, PhaseFailuresCounted) {
  auto metrics = std::make_shared<testing::RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  opt.lexicon = std::make_shared<testing::ThrowingLexicon>();
  RunOk(*Open(opt), Episode());
  EXPECT_EQ(metrics->CounterValue("condense.phase.near.failure_total"), 1u);
  EXPECT_EQ(metrics->CounterValue("condense.phase.exact.failure_total"), 0u);
}

TEST_F(PipelineTest, SkippedInputsCounted) {
  auto metrics = std::make_shared<testing::RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  RunOk(*Open(opt), {NoteInput(), NoteInput("Stable.")});
  EXPECT_EQ(metrics->CounterValue("condense.input.skipped_total"), 1u);
}

TEST_F(PipelineTest, SpanRecorded) {
  auto tracer = std::make_shared<testing::RecordingTracer>();
  Options opt;
  opt.tracer = tracer;
  auto p = Open(opt);
  RunOk(*p, Episode());

  auto spans = tracer->Spans();
  ASSERT_EQ(spans.size(), 1u);
  const auto& span = spans[0];
  EXPECT_EQ(span.name, "condense.Run");
  EXPECT_TRUE(span.ended);
  EXPECT_TRUE(span.ok);
  EXPECT_EQ(span.int_attributes.at("input_count"), 5u);
  EXPECT_EQ(span.int_attributes.at("output_count"), 2u);
  EXPECT_EQ(span.int_attributes.at("cluster_count"), 4u);
  EXPECT_EQ(span.string_attributes.at("status"), "ok");
  EXPECT_EQ(span.events, (std::vector<std::string>{
                             "condense.phase.exact.done", "condense.phase.near.done",
                             "condense.phase.sentence.done", "condense.phase.merge.done"}));
}

TEST_F(PipelineTest, PartialSpan) {
  auto clock = std::make_shared<testing::FakeClock>();
  auto tracer = std::make_shared<testing::RecordingTracer>();
  Options opt;
  opt.clock = clock;
  opt.lexicon = std::make_shared<testing::ClockAdvancingLexicon>(clock, 10);
  opt.timeout_ms = 5;
  opt.tracer = tracer;
  RunOk(*Open(opt), Episode());

  auto spans = tracer->Spans();
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_FALSE(spans[0].ok);
  EXPECT_EQ(spans[0].string_attributes.at("status"), "timed_out");
  EXPECT_EQ(spans[0].events, (std::vector<std::string>{"condense.phase.exact.done",
                                                        "condense.phase.near.timed_out"}));
}

}  // namespace
}  // namespace condense
