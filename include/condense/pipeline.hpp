#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

#include <condense/clock.hpp>
#include <condense/entity_counter.hpp>
#include <condense/lexicon.hpp>
#include <condense/note.hpp>
#include <condense/priority.hpp>
#include <condense/similarity.hpp>

namespace condense {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, removed notes, phase failures). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values. Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const rocksdb::Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Options for a condense pipeline. Immutable once the pipeline is created.
 */
struct Options {
  // Similarity component weights (must sum to 1.0).
  SimilarityWeights weights;

  // Combined score at or above which two notes are near-duplicates.
  double threshold_near = 0.85;

  // Combined score at or above which two sentences are duplicates.
  double threshold_sentence = 0.85;

  // Notes scoring in [complementary_low, complementary_high) are merge
  // candidates when they share temporal context.
  double complementary_low = 0.30;
  double complementary_high = 0.60;

  // Order output by each note's earliest folded-in input; when false, by the
  // representative's own sequence index.
  bool preserve_chronology = true;

  // Run the complementary merge phase.
  bool merge_complementary = true;

  // Sentences whose normalized form is shorter than this are only removed
  // on an exact normalized match.
  size_t min_sentence_chars = 10;

  // Prefix bound for the character edit distance (0 = unbounded).
  size_t levenshtein_max_chars = 0;

  // Worker threads for pairwise comparisons. Output does not depend on it.
  size_t num_threads = 1;

  // Run deadline in milliseconds (0 = none). On expiry the result is partial.
  uint64_t timeout_ms = 0;

  // Collaborators (optional)
  //
  // lexicon: concept extraction for the semantic component
  //          (null = DefaultConceptLexicon()).
  // entity_counter: entity / temporal-marker counts for priority
  //          (null = both counts are zero).
  // clock: time source for the deadline (null = RealClock).
  std::shared_ptr<const ConceptLexicon> lexicon;
  std::shared_ptr<const EntityCounter> entity_counter;
  std::shared_ptr<const Clock> clock;

  // Observability hooks (optional)
  //
  // If set, Run() emits a small number of counters/histograms and attaches
  // attributes/events to a span.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;

  /** InvalidArgument describing the first offending field, or OK. */
  rocksdb::Status Validate() const;
};

/** A near-duplicate cluster: the kept note and every note folded into it. */
struct Cluster {
  std::string representative_note_id;
  std::vector<std::string> member_note_ids;  // includes the representative
};

/** An output note. */
struct ResultNote {
  std::string id;
  std::string text;
  SourceRole source_role = SourceRole::kUnknown;
  int64_t sequence_index = 0;
  int64_t earliest_sequence_index = 0;

  // Ids of every input note folded into this one, ordered by sequence index.
  std::vector<std::string> provenance;

  bool merged = false;    // absorbed at least one complementary note
  bool modified = false;  // text differs from the representative's input text
};

/** A phase that raised an exception; its input was passed through unchanged. */
struct PhaseError {
  std::string phase;
  std::string message;
};

struct PhaseStats {
  size_t exact_removed = 0;
  size_t near_removed = 0;
  size_t sentences_removed = 0;
  size_t notes_emptied = 0;
  size_t merged = 0;
  size_t skipped_inputs = 0;

  // Phases that ran to completion (exact, near, sentence, merge).
  size_t phases_completed = 0;

  uint64_t exact_us = 0;
  uint64_t near_us = 0;
  uint64_t sentence_us = 0;
  uint64_t merge_us = 0;

  std::vector<PhaseError> errors;
};

struct DeduplicationResult {
  std::vector<ResultNote> notes;
  size_t input_count = 0;
  size_t output_count = 0;
  double reduction_percent = 0.0;
  size_t cluster_count = 0;
  std::vector<Cluster> clusters;
  PhaseStats phase_stats;

  // True when the deadline expired and later phases were skipped.
  bool partial = false;
};

/**
 * condense::Pipeline
 *
 * Multi-phase deduplication of clinical notes describing one episode:
 *  1. exact duplicates (SHA-256 of normalized text)
 *  2. near-duplicate clusters (weighted lexical + concept similarity)
 *  3. repeated sentences across surviving notes
 *  4. complementary notes sharing temporal context are merged
 *
 * A pipeline is immutable after Create() and Run() is const, so one instance
 * may serve concurrent callers.
 */
class Pipeline {
 public:
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  /** Validate options and build a pipeline. */
  static rocksdb::Status Create(std::unique_ptr<Pipeline>* out,
                                const Options& opt = Options{});

  /**
   * Deduplicate `inputs`. Always produces a result: invalid inputs are
   * skipped, failing phases are recorded in phase_stats.errors and bypassed,
   * an expired deadline yields a partial result. Returns non-OK only for a
   * null `out`.
   */
  rocksdb::Status Run(const std::vector<NoteInput>& inputs, DeduplicationResult* out) const;

  /** Score two raw texts with this pipeline's weights and lexicon. */
  SimilarityScore Similarity(std::string_view a, std::string_view b) const;

  const Options& options() const { return opt_; }

 private:
  explicit Pipeline(const Options& opt);

  Options opt_;
  std::unique_ptr<SimilarityScorer> scorer_;
  std::unique_ptr<PriorityScorer> priority_;
};

/**
 * Turn a result back into inputs (id, text, role, sequence index). Each note
 * is reseeded at its earliest folded-in index so a rerun keeps the order.
 */
std::vector<NoteInput> NoteInputsFromResult(const DeduplicationResult& result);

}  // namespace condense
