#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>

namespace condense {

/** Concept categories. A token only matches another token of the same category. */
enum class ConceptCategory {
  kProcedure,
  kPathology,
  kImaging,
  kMedication,
  kAnatomy,
  kFinding,
  kTemporal   // postoperative / hospital day markers ("pod 3", "hd 2")
};

std::string_view ConceptCategoryName(ConceptCategory category);

/** A category-qualified concept token, e.g. (kProcedure, "coiling"). */
struct Concept {
  ConceptCategory category = ConceptCategory::kFinding;
  std::string token;

  bool operator<(const Concept& o) const {
    return std::tie(category, token) < std::tie(o.category, o.token);
  }
  bool operator==(const Concept& o) const {
    return category == o.category && token == o.token;
  }
};

using ConceptSet = std::set<Concept>;

/**
 * Concept extraction collaborator used by the semantic similarity component.
 * Implementations must be pure and safe to call from several threads.
 */
class ConceptLexicon {
 public:
  virtual ~ConceptLexicon() = default;

  /** Extract concepts from normalized text (see NormalizedText::text). */
  virtual ConceptSet Extract(std::string_view normalized_text) const = 0;
};

/**
 * Built-in neurosurgical lexicon: a static keyword -> (category, canonical)
 * table loaded once. Synonyms and brand names map onto one canonical token
 * ("keppra" and "levetiracetam" are the same medication). Matching is
 * greedy longest-phrase over whole words.
 *
 * Day markers are recognized structurally: "pod <n>", "hd <n>",
 * "postoperative day <n>", "post op day <n>" and "hospital day <n>" become
 * temporal concepts "pod <n>" / "hd <n>".
 */
class StaticConceptLexicon : public ConceptLexicon {
 public:
  StaticConceptLexicon();

  ConceptSet Extract(std::string_view normalized_text) const override;

  /** Table version; equals kConceptLexiconVersion. */
  int Version() const;

  /** Number of phrases (canonical tokens and synonyms) in the table. */
  size_t PhraseCount() const { return table_.size(); }

 private:
  struct Entry {
    ConceptCategory category;
    std::string canonical;
  };

  std::unordered_map<std::string, Entry> table_;
  size_t max_phrase_words_ = 1;
};

/** Process-wide instance of the built-in lexicon. */
std::shared_ptr<const ConceptLexicon> DefaultConceptLexicon();

}  // namespace condense
