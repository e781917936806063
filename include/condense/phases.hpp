#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <rocksdb/status.h>

#include <condense/internal.hpp>
#include <condense/lexicon.hpp>
#include <condense/normalize.hpp>
#include <condense/note.hpp>
#include <condense/pipeline.hpp>
#include <condense/priority.hpp>
#include <condense/similarity.hpp>

namespace condense::internal {

struct Provenance {
  std::string note_id;
  int64_t sequence_index = 0;
};

/** One sentence of a working note. Concepts are extracted on first use. */
struct Sentence {
  std::string source_note_id;
  size_t position = 0;
  std::string text;  // display text
  NormalizedText normalized;
  ConceptSet concepts;
  bool concepts_ready = false;
};

/**
 * A note as it moves through the phases. `note.raw_text` is the current
 * text; it only changes when sentences are removed or a note is merged in.
 */
struct WorkingNote {
  Note note;
  NormalizedText normalized;
  ConceptSet concepts;
  bool concepts_ready = false;
  std::vector<Sentence> sentences;
  PriorityScore priority;
  std::vector<Provenance> provenance;  // ordered by sequence index
  bool merged = false;
  bool modified = false;

  int64_t EarliestSequence() const;
};

/** Everything a phase reads. Nothing here is mutated by a phase. */
struct PhaseEnv {
  const Options* options = nullptr;
  const SimilarityScorer* scorer = nullptr;
  const PriorityScorer* priority = nullptr;
  const Deadline* deadline = nullptr;
};

/** Normalize, split and score `note`; provenance starts as the note itself. */
WorkingNote MakeWorkingNote(Note note, const PhaseEnv& env);

/** Recompute normalization, sentences and priority after the text changed. */
void Reanalyze(WorkingNote* note, const PhaseEnv& env);

/** Extract note concepts if not done yet. May throw (lexicon). */
void EnsureConcepts(WorkingNote* note, const PhaseEnv& env);
void EnsureConcepts(Sentence* sentence, const PhaseEnv& env);

/** Append `from`'s provenance to `into`, keeping it ordered by sequence index. */
void FoldProvenance(WorkingNote* into, const WorkingNote& from);

/** Stable sort by the note's own sequence index. */
void SortBySequence(std::vector<WorkingNote>* notes);

/** Two sentences are duplicates: equal normalized text, or (both long enough) combined >= threshold_sentence. */
bool SentencesMatch(Sentence* a, Sentence* b, const PhaseEnv& env);

// ---------------------------------------------------------------------------
// Phases. Each mutates `notes` in place and returns OK or TimedOut; the
// caller hands them a copy so a failing phase leaves its input intact.
// Exceptions from collaborators propagate.
// ---------------------------------------------------------------------------

/** Group by fingerprint of the normalized text, keep the top-priority note. */
rocksdb::Status DeduplicateExact(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                 size_t* removed);

/** Greedy seed clustering at threshold_near. Emits one cluster per survivor. */
rocksdb::Status ClusterNearDuplicates(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                      std::vector<Cluster>* clusters, size_t* removed);

struct SentenceDedupCounts {
  size_t sentences_removed = 0;
  size_t notes_emptied = 0;
};

/** Drop later repeats of sentences across notes, first occurrence wins. */
rocksdb::Status DeduplicateSentences(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                     SentenceDedupCounts* counts);

/** Merge complementary notes sharing temporal context until a pass merges nothing. */
rocksdb::Status MergeComplementary(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                   size_t* merged);

}  // namespace condense::internal
