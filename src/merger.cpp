#include <condense/phases.hpp>

#include <algorithm>
#include <set>
#include <utility>

#include <condense/temporal.hpp>

namespace condense::internal {

namespace {

bool Intersects(const std::set<std::string>& a, const std::set<std::string>& b) {
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia < *ib) {
      ++ia;
    } else if (*ib < *ia) {
      ++ib;
    } else {
      return true;
    }
  }
  return false;
}

// Shared date/POD/HD anchor, or adjacency without conflicting anchors.
bool SameTemporalContext(const std::set<std::string>& a, const std::set<std::string>& b,
                         bool adjacent) {
  if (Intersects(a, b)) return true;
  if (!adjacent) return false;
  return a.empty() || b.empty();
}

// Sentence union of `from` into `into`, dropping repeats. `into` keeps its
// id and takes the earlier sequence index and the stronger role.
void MergeInto(WorkingNote* into, WorkingNote* from, const PhaseEnv& env) {
  std::vector<Sentence*> pool;
  pool.reserve(into->sentences.size() + from->sentences.size());
  for (auto& s : into->sentences) pool.push_back(&s);
  for (auto& s : from->sentences) pool.push_back(&s);

  std::vector<Sentence*> kept;
  kept.reserve(pool.size());
  for (Sentence* s : pool) {
    bool duplicate = false;
    for (Sentence* k : kept) {
      if (SentencesMatch(k, s, env)) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) kept.push_back(s);
  }

  std::vector<std::string> texts;
  texts.reserve(kept.size());
  for (const Sentence* s : kept) texts.push_back(s->text);

  into->note.raw_text = JoinSentences(texts);
  into->note.sequence_index = std::min(into->note.sequence_index, from->note.sequence_index);
  if (RoleBonus(from->note.source_role) > RoleBonus(into->note.source_role)) {
    into->note.source_role = from->note.source_role;
  }
  FoldProvenance(into, *from);
  into->merged = true;
  into->modified = true;
  Reanalyze(into, env);
}

}  // namespace

rocksdb::Status MergeComplementary(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                   size_t* merged) {
  if (!notes || !merged) return rocksdb::Status::InvalidArgument("output is null");
  *merged = 0;

  auto& list = *notes;
  const double low = env.options->complementary_low;
  const double high = env.options->complementary_high;

  std::vector<bool> absorbed(list.size(), false);
  std::vector<std::set<std::string>> anchors(list.size());
  for (size_t i = 0; i < list.size(); ++i) anchors[i] = TemporalAnchors(list[i].note.raw_text);

  bool changed = true;
  while (changed) {
    changed = false;
    for (size_t i = 0; i < list.size(); ++i) {
      if (absorbed[i]) continue;
      // Adjacent while every note between i and j has been absorbed.
      bool adjacent = true;
      for (size_t j = i + 1; j < list.size(); ++j) {
        if (absorbed[j]) continue;
        if (env.deadline->Expired()) return rocksdb::Status::TimedOut("merge deadline");

        EnsureConcepts(&list[i], env);
        EnsureConcepts(&list[j], env);
        const double combined = env.scorer
                                    ->Score(list[i].normalized, list[i].concepts,
                                            list[j].normalized, list[j].concepts)
                                    .combined;

        if (combined >= low && combined < high &&
            SameTemporalContext(anchors[i], anchors[j], adjacent)) {
          MergeInto(&list[i], &list[j], env);
          anchors[i] = TemporalAnchors(list[i].note.raw_text);
          absorbed[j] = true;
          ++*merged;
          changed = true;
          continue;
        }
        adjacent = false;
      }
    }
  }

  std::vector<WorkingNote> out;
  out.reserve(list.size() - *merged);
  for (size_t i = 0; i < list.size(); ++i) {
    if (!absorbed[i]) out.push_back(std::move(list[i]));
  }
  *notes = std::move(out);
  return rocksdb::Status::OK();
}

}  // namespace condense::internal
