#pragma once

#include <condense/lexicon.hpp>

#include <cstddef>
#include <memory>
#include <string_view>

namespace condense {

/**
 * Entity / temporal-marker counting collaborator used by the priority scorer.
 * Implementations must be pure and safe to call from several threads.
 */
class EntityCounter {
 public:
  virtual ~EntityCounter() = default;

  /** Number of clinical entities mentioned in raw note text. */
  virtual size_t CountEntities(std::string_view text) const = 0;

  /** Number of distinct temporal markers in raw note text. */
  virtual size_t CountTemporalMarkers(std::string_view text) const = 0;
};

/**
 * Default counter: entities are the distinct non-temporal concepts the
 * lexicon finds in the normalized note; temporal markers come from
 * ExtractTemporalMarkers().
 */
class KeywordEntityCounter : public EntityCounter {
 public:
  explicit KeywordEntityCounter(
      std::shared_ptr<const ConceptLexicon> lexicon = DefaultConceptLexicon());

  size_t CountEntities(std::string_view text) const override;
  size_t CountTemporalMarkers(std::string_view text) const override;

 private:
  std::shared_ptr<const ConceptLexicon> lexicon_;
};

}  // namespace condense
