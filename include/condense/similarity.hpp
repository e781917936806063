#pragma once

#include <condense/lexicon.hpp>
#include <condense/normalize.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace condense {

/** Component weights for the combined score. Must each be in [0,1] and sum to 1. */
struct SimilarityWeights {
  double jaccard = 0.4;
  double levenshtein = 0.2;
  double semantic = 0.4;

  // Tolerance on the sum.
  static constexpr double kSumEpsilon = 1e-6;

  /** InvalidArgument if a weight is out of range, not finite, or the sum is off. */
  rocksdb::Status Validate() const;
};

struct SimilarityScore {
  double jaccard = 0.0;
  double levenshtein = 0.0;
  double semantic = 0.0;
  double combined = 0.0;
};

/** |A n B| / |A u B| over two sorted, distinct word lists. Both empty -> 0. */
double JaccardSimilarity(const std::vector<std::string>& sorted_a,
                         const std::vector<std::string>& sorted_b);

/** Character edit distance (insert / delete / substitute), two-row DP. */
size_t LevenshteinDistance(std::string_view a, std::string_view b);

/**
 * 1 - d / max(len) clamped to [0,1]; both empty -> 1.
 * When max_chars > 0 only the first max_chars bytes of each side are compared.
 */
double LevenshteinSimilarity(std::string_view a, std::string_view b, size_t max_chars = 0);

/** Jaccard over concept sets. Both empty -> 0. */
double ConceptSimilarity(const ConceptSet& a, const ConceptSet& b);

/**
 * Scores pairs of normalized texts.
 *
 * Every component and the combined value are symmetric in their arguments
 * and lie in [0,1]. The scorer never throws on its own; an exception from
 * the lexicon collaborator propagates to the caller.
 */
class SimilarityScorer {
 public:
  /**
   * Weights are taken as given; validate them first (Pipeline::Create does).
   * A null lexicon selects DefaultConceptLexicon().
   */
  explicit SimilarityScorer(SimilarityWeights weights = SimilarityWeights{},
                            std::shared_ptr<const ConceptLexicon> lexicon = nullptr,
                            size_t levenshtein_max_chars = 0);

  /** Concepts of a normalized text, for reuse across many Score() calls. */
  ConceptSet Concepts(const NormalizedText& text) const;

  SimilarityScore Score(const NormalizedText& a, const NormalizedText& b) const;

  /** Same as Score(a, b) with concept sets precomputed by Concepts(). */
  SimilarityScore Score(const NormalizedText& a, const ConceptSet& concepts_a,
                        const NormalizedText& b, const ConceptSet& concepts_b) const;

  const SimilarityWeights& weights() const { return weights_; }

 private:
  SimilarityWeights weights_;
  std::shared_ptr<const ConceptLexicon> lexicon_;
  size_t levenshtein_max_chars_;
};

}  // namespace condense
