#include <condense/pipeline.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <unordered_set>
#include <utility>

#include <trantor/utils/Logger.h>

#include <condense/internal.hpp>
#include <condense/phases.hpp>

namespace condense {

namespace {

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const condense::Options& opt,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const condense::Options& opt,
                          std::string_view name,
                          uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

inline void EmitGauge(const condense::Options& opt,
                      std::string_view name,
                      double value) {
  if (opt.metrics) opt.metrics->Gauge(name, value);
}

// Map statuses to low-cardinality strings for tracing.
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsIOError()) return "io_error";
  return "other";
}

inline void SpanAttr(condense::TraceSpan* span,
                     std::string_view key,
                     uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(condense::TraceSpan* span,
                     std::string_view key,
                     std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanEvent(condense::TraceSpan* span, std::string_view name) {
  if (span) span->AddEvent(name);
}

std::string PhaseMetric(std::string_view phase, std::string_view suffix) {
  std::string name = "condense.phase.";
  name.append(phase.data(), phase.size());
  name += '.';
  name.append(suffix.data(), suffix.size());
  return name;
}

bool InUnitRange(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

enum class PhaseOutcome { kCompleted, kFailed, kTimedOut };

// Failure boundary around one phase. The phase works on a copy; only a
// completed phase replaces `notes`.
template <typename Fn>
PhaseOutcome RunPhase(const Options& opt,
                      std::string_view phase,
                      std::vector<internal::WorkingNote>* notes,
                      PhaseStats* stats,
                      uint64_t* duration_us,
                      TraceSpan* span,
                      Fn&& fn) {
  const Clock& clock = *opt.clock;
  const uint64_t start_us = clock.NowMicros();
  std::vector<internal::WorkingNote> work = *notes;

  rocksdb::Status st;
  bool threw = false;
  std::string message;
  try {
    st = fn(&work);
  } catch (const std::exception& e) {
    threw = true;
    message = e.what();
  } catch (...) {
    threw = true;
    message = "unknown exception";
  }

  *duration_us = clock.NowMicros() - start_us;
  EmitHistogram(opt, PhaseMetric(phase, "latency_us"), *duration_us);

  if (!threw && !st.ok() && !st.IsTimedOut()) {
    threw = true;
    message = st.ToString();
  }
  if (threw) {
    LOG_WARN << "phase " << phase << " failed, passing its input through: " << message;
    stats->errors.push_back({std::string(phase), message});
    EmitCounter(opt, PhaseMetric(phase, "failure_total"), 1);
    SpanEvent(span, PhaseMetric(phase, "failed"));
    return PhaseOutcome::kFailed;
  }
  if (st.IsTimedOut()) {
    LOG_WARN << "phase " << phase << " hit the deadline, returning partial result";
    SpanEvent(span, PhaseMetric(phase, "timed_out"));
    return PhaseOutcome::kTimedOut;
  }

  *notes = std::move(work);
  ++stats->phases_completed;
  SpanEvent(span, PhaseMetric(phase, "done"));
  return PhaseOutcome::kCompleted;
}

std::vector<Cluster> SingletonClusters(const std::vector<internal::WorkingNote>& notes) {
  std::vector<Cluster> clusters;
  clusters.reserve(notes.size());
  for (const auto& w : notes) clusters.push_back({w.note.id, {w.note.id}});
  return clusters;
}

ResultNote ToResultNote(const internal::WorkingNote& w) {
  ResultNote r;
  r.id = w.note.id;
  r.text = w.note.raw_text;
  r.source_role = w.note.source_role;
  r.sequence_index = w.note.sequence_index;
  r.earliest_sequence_index = w.EarliestSequence();
  r.provenance.reserve(w.provenance.size());
  for (const auto& p : w.provenance) r.provenance.push_back(p.note_id);
  r.merged = w.merged;
  r.modified = w.modified;
  return r;
}

}  // namespace

rocksdb::Status Options::Validate() const {
  rocksdb::Status st = weights.Validate();
  if (!st.ok()) return st;
  if (!InUnitRange(threshold_near)) {
    return rocksdb::Status::InvalidArgument("threshold_near must be in [0, 1]");
  }
  if (!InUnitRange(threshold_sentence)) {
    return rocksdb::Status::InvalidArgument("threshold_sentence must be in [0, 1]");
  }
  if (!InUnitRange(complementary_low) || !InUnitRange(complementary_high)) {
    return rocksdb::Status::InvalidArgument("complementary band must be in [0, 1]");
  }
  if (complementary_low >= complementary_high) {
    return rocksdb::Status::InvalidArgument(
        "complementary_low must be less than complementary_high");
  }
  if (num_threads < 1) {
    return rocksdb::Status::InvalidArgument("num_threads must be at least 1");
  }
  return rocksdb::Status::OK();
}

Pipeline::Pipeline(const Options& opt) : opt_(opt) {}

Pipeline::~Pipeline() = default;

rocksdb::Status Pipeline::Create(std::unique_ptr<Pipeline>* out, const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  rocksdb::Status st = opt.Validate();
  if (!st.ok()) return st;

  auto pipeline = std::unique_ptr<Pipeline>(new Pipeline(opt));
  if (!pipeline->opt_.lexicon) pipeline->opt_.lexicon = DefaultConceptLexicon();
  if (!pipeline->opt_.clock) pipeline->opt_.clock = std::make_shared<RealClock>();
  pipeline->scorer_ = std::make_unique<SimilarityScorer>(
      opt.weights, pipeline->opt_.lexicon, opt.levenshtein_max_chars);
  pipeline->priority_ = std::make_unique<PriorityScorer>(opt.entity_counter);

  *out = std::move(pipeline);
  return rocksdb::Status::OK();
}

SimilarityScore Pipeline::Similarity(std::string_view a, std::string_view b) const {
  return scorer_->Score(NormalizeNote(a), NormalizeNote(b));
}

rocksdb::Status Pipeline::Run(const std::vector<NoteInput>& inputs,
                              DeduplicationResult* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  *out = DeduplicationResult{};

  const Clock& clock = *opt_.clock;
  const uint64_t op_start_us = clock.NowMicros();
  EmitCounter(opt_, "condense.run.calls", 1);

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("condense.Run");
  SpanAttr(span.get(), "input_count", static_cast<uint64_t>(inputs.size()));

  const internal::Deadline deadline(opt_.clock.get(), opt_.timeout_ms);
  internal::PhaseEnv env;
  env.options = &opt_;
  env.scorer = scorer_.get();
  env.priority = priority_.get();
  env.deadline = &deadline;

  PhaseStats& stats = out->phase_stats;

  // --------------------------
  // Ingestion
  // --------------------------
  std::vector<internal::WorkingNote> notes;
  notes.reserve(inputs.size());
  std::unordered_set<std::string> seen_ids;
  for (size_t pos = 0; pos < inputs.size(); ++pos) {
    const NoteInput& in = inputs[pos];
    if (!in.text) {
      LOG_WARN << "skipping input " << pos << ": no text";
      ++stats.skipped_inputs;
      continue;
    }

    Note note;
    note.id = in.id ? *in.id : "note-" + std::to_string(pos);
    if (!seen_ids.insert(note.id).second) {
      std::string unique = note.id;
      while (!seen_ids.insert(unique).second) unique += "#" + std::to_string(pos);
      LOG_WARN << "duplicate note id " << note.id << " at input " << pos << ", using "
               << unique;
      note.id = std::move(unique);
    }
    note.raw_text = *in.text;
    note.source_role = in.role ? ParseSourceRole(*in.role) : SourceRole::kUnknown;
    note.sequence_index = in.sequence_index ? *in.sequence_index : static_cast<int64_t>(pos);
    notes.push_back(internal::MakeWorkingNote(std::move(note), env));
  }
  internal::SortBySequence(&notes);
  if (stats.skipped_inputs > 0) {
    EmitCounter(opt_, "condense.input.skipped_total", stats.skipped_inputs);
  }
  out->input_count = notes.size();

  // --------------------------
  // Phases
  // --------------------------
  bool partial = false;
  auto expired_before = [&](std::string_view phase) {
    if (!deadline.Expired()) return false;
    LOG_WARN << "deadline expired before phase " << phase << ", returning partial result";
    return true;
  };

  // Exact
  if (expired_before("exact")) partial = true;
  if (!partial) {
    size_t removed = 0;
    auto outcome = RunPhase(opt_, "exact", &notes, &stats, &stats.exact_us, span.get(),
                            [&](std::vector<internal::WorkingNote>* work) {
                              return internal::DeduplicateExact(env, work, &removed);
                            });
    if (outcome == PhaseOutcome::kCompleted) {
      stats.exact_removed = removed;
      EmitCounter(opt_, "condense.phase.exact.removed_total", removed);
    }
    partial = outcome == PhaseOutcome::kTimedOut;
  }

  // Near
  bool clustered = false;
  if (!partial && expired_before("near")) partial = true;
  if (!partial) {
    size_t removed = 0;
    std::vector<Cluster> clusters;
    auto outcome = RunPhase(opt_, "near", &notes, &stats, &stats.near_us, span.get(),
                            [&](std::vector<internal::WorkingNote>* work) {
                              return internal::ClusterNearDuplicates(env, work, &clusters,
                                                                     &removed);
                            });
    if (outcome == PhaseOutcome::kCompleted) {
      stats.near_removed = removed;
      out->clusters = std::move(clusters);
      clustered = true;
      EmitCounter(opt_, "condense.phase.near.removed_total", removed);
    }
    partial = outcome == PhaseOutcome::kTimedOut;
  }
  if (!clustered) out->clusters = SingletonClusters(notes);
  out->cluster_count = out->clusters.size();

  // Sentence
  if (!partial && expired_before("sentence")) partial = true;
  if (!partial) {
    internal::SentenceDedupCounts counts;
    auto outcome = RunPhase(opt_, "sentence", &notes, &stats, &stats.sentence_us, span.get(),
                            [&](std::vector<internal::WorkingNote>* work) {
                              return internal::DeduplicateSentences(env, work, &counts);
                            });
    if (outcome == PhaseOutcome::kCompleted) {
      stats.sentences_removed = counts.sentences_removed;
      stats.notes_emptied = counts.notes_emptied;
      EmitCounter(opt_, "condense.phase.sentence.removed_total", counts.sentences_removed);
    }
    partial = outcome == PhaseOutcome::kTimedOut;
  }

  // Merge
  if (opt_.merge_complementary) {
    if (!partial && expired_before("merge")) partial = true;
    if (!partial) {
      size_t merged = 0;
      auto outcome = RunPhase(opt_, "merge", &notes, &stats, &stats.merge_us, span.get(),
                              [&](std::vector<internal::WorkingNote>* work) {
                                return internal::MergeComplementary(env, work, &merged);
                              });
      if (outcome == PhaseOutcome::kCompleted) {
        stats.merged = merged;
        EmitCounter(opt_, "condense.phase.merge.removed_total", merged);
      }
      partial = outcome == PhaseOutcome::kTimedOut;
    }
  }

  // --------------------------
  // Result
  // --------------------------
  out->notes.reserve(notes.size());
  for (const auto& w : notes) out->notes.push_back(ToResultNote(w));
  if (opt_.preserve_chronology) {
    std::stable_sort(out->notes.begin(), out->notes.end(),
                     [](const ResultNote& a, const ResultNote& b) {
                       if (a.earliest_sequence_index != b.earliest_sequence_index) {
                         return a.earliest_sequence_index < b.earliest_sequence_index;
                       }
                       return a.sequence_index < b.sequence_index;
                     });
  } else {
    std::stable_sort(out->notes.begin(), out->notes.end(),
                     [](const ResultNote& a, const ResultNote& b) {
                       return a.sequence_index < b.sequence_index;
                     });
  }

  out->output_count = out->notes.size();
  if (out->input_count > 0) {
    const double removed = static_cast<double>(out->input_count - out->output_count);
    out->reduction_percent =
        std::clamp(removed * 100.0 / static_cast<double>(out->input_count), 0.0, 100.0);
  }
  out->partial = partial;

  const uint64_t dur_us = clock.NowMicros() - op_start_us;
  EmitHistogram(opt_, "condense.run.latency_us", dur_us);
  EmitGauge(opt_, "condense.run.reduction_percent", out->reduction_percent);
  if (partial) EmitCounter(opt_, "condense.run.partial_total", 1);

  const rocksdb::Status run_status =
      partial ? rocksdb::Status::TimedOut("deadline expired") : rocksdb::Status::OK();
  if (span) {
    SpanAttr(span.get(), "output_count", static_cast<uint64_t>(out->output_count));
    SpanAttr(span.get(), "cluster_count", static_cast<uint64_t>(out->cluster_count));
    SpanAttr(span.get(), "latency_us", dur_us);
    SpanAttr(span.get(), "status", StatusKind(run_status));
    span->End(run_status);
  }

  LOG_DEBUG << "condense run: " << out->input_count << " -> " << out->output_count
            << " notes, " << stats.errors.size() << " phase errors"
            << (partial ? " (partial)" : "");
  return rocksdb::Status::OK();
}

std::vector<NoteInput> NoteInputsFromResult(const DeduplicationResult& result) {
  std::vector<NoteInput> inputs;
  inputs.reserve(result.notes.size());
  for (const auto& n : result.notes) {
    NoteInput in(n.text, std::string(SourceRoleName(n.source_role)));
    in.sequence_index = n.earliest_sequence_index;
    in.id = n.id;
    inputs.push_back(std::move(in));
  }
  return inputs;
}

}  // namespace condense
