#include <condense/phases.hpp>

#include <algorithm>
#include <utility>

namespace condense::internal {

namespace {

std::vector<Sentence> BuildSentences(const std::string& note_id,
                                     const std::vector<std::string>& texts) {
  std::vector<Sentence> out;
  out.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    Sentence s;
    s.source_note_id = note_id;
    s.position = i;
    s.text = texts[i];
    s.normalized = NormalizeFragment(texts[i]);
    out.push_back(std::move(s));
  }
  return out;
}

}  // namespace

int64_t WorkingNote::EarliestSequence() const {
  int64_t earliest = note.sequence_index;
  for (const auto& p : provenance) earliest = std::min(earliest, p.sequence_index);
  return earliest;
}

WorkingNote MakeWorkingNote(Note note, const PhaseEnv& env) {
  WorkingNote w;
  w.note = std::move(note);
  w.provenance.push_back({w.note.id, w.note.sequence_index});
  Reanalyze(&w, env);
  return w;
}

void Reanalyze(WorkingNote* note, const PhaseEnv& env) {
  note->normalized = NormalizeNote(note->note.raw_text);
  note->sentences = BuildSentences(note->note.id, note->normalized.sentences);
  note->concepts.clear();
  note->concepts_ready = false;
  note->priority = env.priority->Score(note->note, note->normalized);
}

void EnsureConcepts(WorkingNote* note, const PhaseEnv& env) {
  if (note->concepts_ready) return;
  note->concepts = env.scorer->Concepts(note->normalized);
  note->concepts_ready = true;
}

void EnsureConcepts(Sentence* sentence, const PhaseEnv& env) {
  if (sentence->concepts_ready) return;
  sentence->concepts = env.scorer->Concepts(sentence->normalized);
  sentence->concepts_ready = true;
}

void FoldProvenance(WorkingNote* into, const WorkingNote& from) {
  into->provenance.insert(into->provenance.end(), from.provenance.begin(),
                          from.provenance.end());
  std::stable_sort(into->provenance.begin(), into->provenance.end(),
                   [](const Provenance& a, const Provenance& b) {
                     return a.sequence_index < b.sequence_index;
                   });
}

void SortBySequence(std::vector<WorkingNote>* notes) {
  std::stable_sort(notes->begin(), notes->end(), [](const WorkingNote& a, const WorkingNote& b) {
    return a.note.sequence_index < b.note.sequence_index;
  });
}

bool SentencesMatch(Sentence* a, Sentence* b, const PhaseEnv& env) {
  if (a->normalized.text == b->normalized.text) return true;
  const size_t min_chars = env.options->min_sentence_chars;
  if (a->normalized.text.size() < min_chars || b->normalized.text.size() < min_chars) {
    return false;
  }
  EnsureConcepts(a, env);
  EnsureConcepts(b, env);
  const auto score = env.scorer->Score(a->normalized, a->concepts, b->normalized, b->concepts);
  return score.combined >= env.options->threshold_sentence;
}

}  // namespace condense::internal
