#include <condense/phases.hpp>

#include <atomic>
#include <unordered_map>
#include <utility>

namespace condense::internal {

namespace {

constexpr size_t kNoMatch = static_cast<size_t>(-1);

struct Retained {
  const Sentence* sentence;
  size_t owner;  // index of the owning note
};

}  // namespace

rocksdb::Status DeduplicateSentences(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                     SentenceDedupCounts* counts) {
  if (!notes || !counts) return rocksdb::Status::InvalidArgument("output is null");
  *counts = SentenceDedupCounts{};

  auto& list = *notes;
  const size_t min_chars = env.options->min_sentence_chars;
  const double threshold = env.options->threshold_sentence;

  std::vector<Retained> retained;
  std::unordered_map<std::string, size_t> exact;  // normalized text -> retained index
  std::vector<std::vector<bool>> keep(list.size());
  // Owner of the retained sentence that matched a note's first dropped sentence.
  std::vector<size_t> first_match_owner(list.size(), kNoMatch);

  for (size_t i = 0; i < list.size(); ++i) {
    auto& sentences = list[i].sentences;
    keep[i].assign(sentences.size(), true);

    for (size_t p = 0; p < sentences.size(); ++p) {
      if (env.deadline->Expired()) return rocksdb::Status::TimedOut("sentence dedup deadline");
      Sentence& s = sentences[p];

      size_t match = kNoMatch;
      auto hit = exact.find(s.normalized.text);
      if (hit != exact.end()) {
        match = hit->second;
      } else if (s.normalized.text.size() >= min_chars) {
        EnsureConcepts(&s, env);

        std::vector<char> matches(retained.size(), 0);
        std::atomic<bool> timed_out{false};
        ParallelFor(retained.size(), env.options->num_threads, [&](size_t k) {
          if (timed_out.load(std::memory_order_relaxed)) return;
          if (env.deadline->Expired()) {
            timed_out.store(true, std::memory_order_relaxed);
            return;
          }
          const Sentence& r = *retained[k].sentence;
          if (r.normalized.text.size() < min_chars) return;
          const auto score = env.scorer->Score(r.normalized, r.concepts, s.normalized, s.concepts);
          if (score.combined >= threshold) matches[k] = 1;
        });
        if (timed_out.load()) return rocksdb::Status::TimedOut("sentence dedup deadline");

        for (size_t k = 0; k < matches.size(); ++k) {
          if (matches[k]) {
            match = k;
            break;
          }
        }
      }

      if (match != kNoMatch) {
        keep[i][p] = false;
        ++counts->sentences_removed;
        if (first_match_owner[i] == kNoMatch) first_match_owner[i] = retained[match].owner;
        continue;
      }
      exact.emplace(s.normalized.text, retained.size());
      retained.push_back({&s, i});
    }
  }

  // Rebuild. Emptied notes fold into the owner of their first matched sentence,
  // which always survives since it retains at least that sentence.
  std::vector<bool> removed(list.size(), false);
  std::vector<bool> rewritten(list.size(), false);
  for (size_t i = 0; i < list.size(); ++i) {
    auto& w = list[i];
    const size_t total = w.sentences.size();
    size_t kept_count = 0;
    for (bool k : keep[i]) kept_count += k ? 1 : 0;
    if (kept_count == total) continue;

    if (kept_count == 0) {
      FoldProvenance(&list[first_match_owner[i]], w);
      removed[i] = true;
      ++counts->notes_emptied;
      continue;
    }

    std::vector<std::string> texts;
    texts.reserve(kept_count);
    for (size_t p = 0; p < total; ++p) {
      if (keep[i][p]) texts.push_back(w.sentences[p].text);
    }
    w.note.raw_text = JoinSentences(texts);
    w.modified = true;
    rewritten[i] = true;
  }

  // Reanalysis invalidates the Sentence pointers held above, so it runs last.
  std::vector<WorkingNote> out;
  out.reserve(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    if (removed[i]) continue;
    if (rewritten[i]) Reanalyze(&list[i], env);
    out.push_back(std::move(list[i]));
  }
  *notes = std::move(out);
  return rocksdb::Status::OK();
}

}  // namespace condense::internal
