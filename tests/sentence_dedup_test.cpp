// Unit tests for the sentence deduplication phase (condense/phases.hpp)
// Tests: cross-note repeats, emptied notes, short sentences, deadline

#include <gtest/gtest.h>

#include <condense/phases.hpp>
#include <condense/test_utils.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace condense::internal {
namespace {

class SentenceDedupTest : public ::testing::Test {
 protected:
  SentenceDedupTest() { Rebuild(nullptr); }

  void Rebuild(std::shared_ptr<const ConceptLexicon> lexicon) {
    scorer_ = std::make_unique<SimilarityScorer>(opt_.weights, std::move(lexicon));
    env_.options = &opt_;
    env_.scorer = scorer_.get();
    env_.priority = &priority_;
    env_.deadline = &no_deadline_;
  }

  std::vector<WorkingNote> Notes(const std::vector<std::string>& texts) {
    std::vector<WorkingNote> out;
    for (size_t i = 0; i < texts.size(); ++i) {
      Note n;
      n.id = "n" + std::to_string(i);
      n.raw_text = texts[i];
      n.sequence_index = static_cast<int64_t>(i);
      out.push_back(MakeWorkingNote(std::move(n), env_));
    }
    return out;
  }

  Options opt_;
  PriorityScorer priority_;
  std::unique_ptr<SimilarityScorer> scorer_;
  Deadline no_deadline_{nullptr, 0};
  PhaseEnv env_;
};

TEST_F(SentenceDedupTest, LaterRepeatsRemoved) {
  auto notes = Notes({
      "Neuro exam stable without new deficit. Continue nimodipine.",
      "Neuro exam stable without new deficit. Started Keppra.",
      "Neuro exam stable without new deficit.",
  });
  SentenceDedupCounts counts;
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());

  EXPECT_EQ(counts.sentences_removed, 2u);
  EXPECT_EQ(counts.notes_emptied, 1u);
  ASSERT_EQ(notes.size(), 2u);

  EXPECT_EQ(notes[0].note.id, "n0");
  EXPECT_EQ(notes[0].note.raw_text,
            "Neuro exam stable without new deficit. Continue nimodipine.");
  EXPECT_FALSE(notes[0].modified);

  EXPECT_EQ(notes[1].note.id, "n1");
  EXPECT_EQ(notes[1].note.raw_text, "Started Keppra.");
  EXPECT_TRUE(notes[1].modified);
  // Rewritten notes are reanalyzed.
  ASSERT_EQ(notes[1].sentences.size(), 1u);
  EXPECT_EQ(notes[1].priority.raw_length, std::string("Started Keppra.").size());
}

TEST_F(SentenceDedupTest, EmptiedNoteFoldsIntoMatchOwner) {
  auto notes = Notes({
      "Neuro exam stable without new deficit. Continue nimodipine.",
      "Neuro exam stable without new deficit. Started Keppra.",
      "Neuro exam stable without new deficit.",
  });
  SentenceDedupCounts counts;
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());

  ASSERT_EQ(notes[0].provenance.size(), 2u);
  EXPECT_EQ(notes[0].provenance[0].note_id, "n0");
  EXPECT_EQ(notes[0].provenance[1].note_id, "n2");
  EXPECT_EQ(notes[1].provenance.size(), 1u);
}

TEST_F(SentenceDedupTest, ParaphrasedSentenceRemoved) {
  // The notes as a whole fall below the near threshold; the shared sentence does not.
  auto notes = Notes({
      "Patient developed vasospasm on POD 3.",
      "Pt developed vasospasm POD#3. Started nimodipine.",
  });
  SentenceDedupCounts counts;
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());
  EXPECT_EQ(counts.sentences_removed, 1u);
  EXPECT_EQ(counts.notes_emptied, 0u);
  ASSERT_EQ(notes.size(), 2u);
  EXPECT_EQ(notes[1].note.raw_text, "Started nimodipine.");
}

TEST_F(SentenceDedupTest, ShortSentencesNeedExactMatch) {
  auto notes = Notes({"Stable. Continue nimodipine.", "Stable! Walking."});
  SentenceDedupCounts counts;
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());
  EXPECT_EQ(counts.sentences_removed, 1u);
  EXPECT_EQ(notes[1].note.raw_text, "Walking.");

  notes = Notes({"Pain ok.", "Pain OK now."});
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());
  EXPECT_EQ(counts.sentences_removed, 0u);
  EXPECT_EQ(notes[1].note.raw_text, "Pain OK now.");
  EXPECT_FALSE(notes[1].modified);
}

TEST_F(SentenceDedupTest, RepeatWithinOneNote) {
  auto notes = Notes({"Continue nimodipine. Continue nimodipine."});
  SentenceDedupCounts counts;
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());
  EXPECT_EQ(counts.sentences_removed, 1u);
  ASSERT_EQ(notes.size(), 1u);
  EXPECT_EQ(notes[0].note.raw_text, "Continue nimodipine.");
  EXPECT_TRUE(notes[0].modified);
}

TEST_F(SentenceDedupTest, NothingSharedNothingChanged) {
  auto notes = Notes({"EEG showed no seizure activity.", "Family meeting held."});
  SentenceDedupCounts counts;
  ASSERT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());
  EXPECT_EQ(counts.sentences_removed, 0u);
  EXPECT_EQ(notes.size(), 2u);
  EXPECT_FALSE(notes[0].modified);
  EXPECT_FALSE(notes[1].modified);
}

TEST_F(SentenceDedupTest, ThreadCountDoesNotChangeResult) {
  const std::vector<std::string> texts = {
      "Neuro exam stable without new deficit. Continue nimodipine.",
      "Pt developed vasospasm POD#3. Neuro exam stable without new deficit.",
      "Patient developed vasospasm on POD 3. Started Keppra.",
      "Continue nimodipine. EEG showed no seizure activity.",
  };
  auto run = [&](size_t threads) {
    opt_.num_threads = threads;
    auto notes = Notes(texts);
    SentenceDedupCounts counts;
    EXPECT_TRUE(DeduplicateSentences(env_, &notes, &counts).ok());
    std::vector<std::string> out;
    for (const auto& w : notes) out.push_back(w.note.id + ":" + w.note.raw_text);
    return out;
  };
  const auto serial = run(1);
  EXPECT_EQ(run(4), serial);
}

TEST_F(SentenceDedupTest, NullOutputs) {
  std::vector<WorkingNote> notes;
  SentenceDedupCounts counts;
  EXPECT_TRUE(DeduplicateSentences(env_, nullptr, &counts).IsInvalidArgument());
  EXPECT_TRUE(DeduplicateSentences(env_, &notes, nullptr).IsInvalidArgument());
}

TEST_F(SentenceDedupTest, ExpiredDeadline) {
  condense::testing::FakeClock clock;
  Deadline deadline(&clock, 1);
  clock.AdvanceMs(2);
  env_.deadline = &deadline;

  auto notes = Notes({"Continue nimodipine."});
  SentenceDedupCounts counts;
  EXPECT_TRUE(DeduplicateSentences(env_, &notes, &counts).IsTimedOut());
}

TEST_F(SentenceDedupTest, LexiconFailurePropagates) {
  auto notes = Notes({"Neuro exam stable without new deficit.", "Neuro exam unchanged overnight."});
  Rebuild(std::make_shared<condense::testing::ThrowingLexicon>());
  SentenceDedupCounts counts;
  EXPECT_THROW(DeduplicateSentences(env_, &notes, &counts), std::runtime_error);
}

}  // namespace
}  // namespace condense::internal
