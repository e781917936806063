#include <condense/entity_counter.hpp>

#include <condense/normalize.hpp>
#include <condense/temporal.hpp>

#include <algorithm>
#include <utility>

namespace condense {

KeywordEntityCounter::KeywordEntityCounter(std::shared_ptr<const ConceptLexicon> lexicon)
    : lexicon_(lexicon ? std::move(lexicon) : DefaultConceptLexicon()) {}

size_t KeywordEntityCounter::CountEntities(std::string_view text) const {
  const ConceptSet concepts = lexicon_->Extract(NormalizeNote(text).text);
  return static_cast<size_t>(std::count_if(concepts.begin(), concepts.end(), [](const Concept& c) {
    return c.category != ConceptCategory::kTemporal;
  }));
}

size_t KeywordEntityCounter::CountTemporalMarkers(std::string_view text) const {
  return ExtractTemporalMarkers(text).size();
}

}  // namespace condense
