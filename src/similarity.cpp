#include <condense/similarity.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace condense {

namespace {

double Clamp01(double v) {
  if (!(v > 0.0)) return 0.0;  // also maps NaN to 0
  if (v > 1.0) return 1.0;
  return v;
}

bool WeightInRange(double w) { return std::isfinite(w) && w >= 0.0 && w <= 1.0; }

}  // namespace

rocksdb::Status SimilarityWeights::Validate() const {
  if (!WeightInRange(jaccard)) {
    return rocksdb::Status::InvalidArgument("weights.jaccard must be in [0, 1]");
  }
  if (!WeightInRange(levenshtein)) {
    return rocksdb::Status::InvalidArgument("weights.levenshtein must be in [0, 1]");
  }
  if (!WeightInRange(semantic)) {
    return rocksdb::Status::InvalidArgument("weights.semantic must be in [0, 1]");
  }
  const double sum = jaccard + levenshtein + semantic;
  if (std::fabs(sum - 1.0) > kSumEpsilon) {
    return rocksdb::Status::InvalidArgument("weights must sum to 1.0, got " +
                                            std::to_string(sum));
  }
  return rocksdb::Status::OK();
}

double JaccardSimilarity(const std::vector<std::string>& sorted_a,
                         const std::vector<std::string>& sorted_b) {
  if (sorted_a.empty() && sorted_b.empty()) return 0.0;

  size_t common = 0;
  auto ia = sorted_a.begin();
  auto ib = sorted_b.begin();
  while (ia != sorted_a.end() && ib != sorted_b.end()) {
    if (*ia < *ib) {
      ++ia;
    } else if (*ib < *ia) {
      ++ib;
    } else {
      ++common;
      ++ia;
      ++ib;
    }
  }
  const size_t uni = sorted_a.size() + sorted_b.size() - common;
  return static_cast<double>(common) / static_cast<double>(uni);
}

size_t LevenshteinDistance(std::string_view a, std::string_view b) {
  // Keep the shorter string on the inner loop.
  if (a.size() < b.size()) std::swap(a, b);
  if (b.empty()) return a.size();

  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    const char ca = a[i - 1];
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t substitute = prev[j - 1] + (ca == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitute});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

double LevenshteinSimilarity(std::string_view a, std::string_view b, size_t max_chars) {
  if (max_chars > 0) {
    a = a.substr(0, std::min(a.size(), max_chars));
    b = b.substr(0, std::min(b.size(), max_chars));
  }
  const size_t longest = std::max(a.size(), b.size());
  if (longest == 0) return 1.0;
  const size_t d = LevenshteinDistance(a, b);
  return Clamp01(1.0 - static_cast<double>(d) / static_cast<double>(longest));
}

double ConceptSimilarity(const ConceptSet& a, const ConceptSet& b) {
  if (a.empty() && b.empty()) return 0.0;
  size_t common = 0;
  // std::set iterates in order, so a merge walk counts the intersection.
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia < *ib) {
      ++ia;
    } else if (*ib < *ia) {
      ++ib;
    } else {
      ++common;
      ++ia;
      ++ib;
    }
  }
  const size_t uni = a.size() + b.size() - common;
  return static_cast<double>(common) / static_cast<double>(uni);
}

SimilarityScorer::SimilarityScorer(SimilarityWeights weights,
                                   std::shared_ptr<const ConceptLexicon> lexicon,
                                   size_t levenshtein_max_chars)
    : weights_(weights),
      lexicon_(lexicon ? std::move(lexicon) : DefaultConceptLexicon()),
      levenshtein_max_chars_(levenshtein_max_chars) {}

ConceptSet SimilarityScorer::Concepts(const NormalizedText& text) const {
  return lexicon_->Extract(text.text);
}

SimilarityScore SimilarityScorer::Score(const NormalizedText& a, const NormalizedText& b) const {
  return Score(a, Concepts(a), b, Concepts(b));
}

SimilarityScore SimilarityScorer::Score(const NormalizedText& a, const ConceptSet& concepts_a,
                                        const NormalizedText& b,
                                        const ConceptSet& concepts_b) const {
  SimilarityScore s;
  s.jaccard = JaccardSimilarity(a.vocabulary, b.vocabulary);
  s.levenshtein = LevenshteinSimilarity(a.text, b.text, levenshtein_max_chars_);
  s.semantic = ConceptSimilarity(concepts_a, concepts_b);
  s.combined = Clamp01(weights_.jaccard * s.jaccard + weights_.levenshtein * s.levenshtein +
                       weights_.semantic * s.semantic);
  return s;
}

}  // namespace condense
