// Unit tests for condense/lexicon.hpp
// Tests: concept extraction, synonyms, longest-phrase matching, day markers

#include <gtest/gtest.h>

#include <condense/lexicon.hpp>
#include <condense/version.hpp>

#include <string>

namespace condense {
namespace {

Concept C(ConceptCategory category, const std::string& token) {
  return Concept{category, token};
}

class LexiconTest : public ::testing::Test {
 protected:
  ConceptSet Extract(const std::string& normalized) const {
    return lexicon_.Extract(normalized);
  }

  StaticConceptLexicon lexicon_;
};

// =============================================================================
// Basic Extraction
// =============================================================================

TEST_F(LexiconTest, ExtractsPathologyAndDayMarker) {
  auto concepts = Extract("patient developed vasospasm pod 3");
  EXPECT_EQ(concepts, (ConceptSet{C(ConceptCategory::kPathology, "vasospasm"),
                                  C(ConceptCategory::kTemporal, "pod 3")}));
}

TEST_F(LexiconTest, EmptyAndUnknownText) {
  EXPECT_TRUE(Extract("").empty());
  EXPECT_TRUE(Extract("family meeting held").empty());
}

TEST_F(LexiconTest, SynonymsShareCanonicalToken) {
  EXPECT_EQ(Extract("keppra"), Extract("levetiracetam"));
  EXPECT_EQ(Extract("keppra"), (ConceptSet{C(ConceptCategory::kMedication, "levetiracetam")}));
  EXPECT_EQ(Extract("gbm"), Extract("glioblastoma"));
  EXPECT_EQ(Extract("external ventricular drain"), Extract("evd"));
}

TEST_F(LexiconTest, CategoryQualifiesToken) {
  // "temporal" the lobe is anatomy, not a day marker.
  EXPECT_EQ(Extract("temporal lobe"), (ConceptSet{C(ConceptCategory::kAnatomy, "temporal")}));
  EXPECT_FALSE(C(ConceptCategory::kAnatomy, "x") == C(ConceptCategory::kFinding, "x"));
}

// =============================================================================
// Longest Phrase Matching
// =============================================================================

TEST_F(LexiconTest, LongestPhraseWins) {
  EXPECT_EQ(Extract("subarachnoid hemorrhage"),
            (ConceptSet{C(ConceptCategory::kPathology, "subarachnoid hemorrhage")}));
  EXPECT_EQ(Extract("pterional craniotomy"),
            (ConceptSet{C(ConceptCategory::kProcedure, "craniotomy")}));
}

TEST_F(LexiconTest, MatchedWordsAreConsumed) {
  // "mca" matches first, then "aneurysm clipping" as one phrase; the
  // pathology "aneurysm" is not extracted separately.
  EXPECT_EQ(Extract("mca aneurysm clipping"),
            (ConceptSet{C(ConceptCategory::kAnatomy, "middle cerebral artery"),
                        C(ConceptCategory::kProcedure, "clipping")}));
}

// =============================================================================
// Day Markers
// =============================================================================

TEST_F(LexiconTest, DayMarkerForms) {
  const ConceptSet pod3{C(ConceptCategory::kTemporal, "pod 3")};
  EXPECT_EQ(Extract("pod 3"), pod3);
  EXPECT_EQ(Extract("pod 03"), pod3);
  EXPECT_EQ(Extract("postoperative day 3"), pod3);
  EXPECT_EQ(Extract("post op day 3"), pod3);
  EXPECT_EQ(Extract("post operative day 3"), pod3);

  const ConceptSet hd2{C(ConceptCategory::kTemporal, "hd 2")};
  EXPECT_EQ(Extract("hd 2"), hd2);
  EXPECT_EQ(Extract("hospital day 2"), hd2);
}

TEST_F(LexiconTest, DayNumbersAreBounded) {
  EXPECT_TRUE(Extract("pod 1234").empty());
  EXPECT_TRUE(Extract("pod").empty());
}

// =============================================================================
// Table
// =============================================================================

TEST_F(LexiconTest, VersionAndSize) {
  EXPECT_EQ(lexicon_.Version(), kConceptLexiconVersion);
  EXPECT_GT(lexicon_.PhraseCount(), 100u);
}

TEST_F(LexiconTest, DefaultLexiconIsShared) {
  auto a = DefaultConceptLexicon();
  auto b = DefaultConceptLexicon();
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a.get(), b.get());
  EXPECT_EQ(a->Extract("nimodipine"), Extract("nimotop"));
}

TEST_F(LexiconTest, CategoryNames) {
  EXPECT_EQ(ConceptCategoryName(ConceptCategory::kMedication), "medication");
  EXPECT_EQ(ConceptCategoryName(ConceptCategory::kTemporal), "temporal");
  EXPECT_EQ(ConceptCategoryName(ConceptCategory::kProcedure), "procedure");
}

}  // namespace
}  // namespace condense
