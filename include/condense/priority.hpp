#pragma once

#include <condense/entity_counter.hpp>
#include <condense/normalize.hpp>
#include <condense/note.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace condense {

/**
 * Authority / information score of a note, with its components.
 *
 *   score = raw_length / 100 + entities * 10 + temporal_markers * 5
 *         + role_bonus + operative_mention_bonus
 *
 * normalized_length and sequence_index are carried along for tie-breaking.
 */
struct PriorityScore {
  std::string note_id;
  double score = 0.0;

  size_t raw_length = 0;
  size_t entity_count = 0;
  size_t temporal_marker_count = 0;
  double role_bonus = 0.0;
  double operative_mention_bonus = 0.0;

  size_t normalized_length = 0;
  int64_t sequence_index = 0;
};

/** Role bonus: consultant 30, attending 20, operative 15, everything else 0. */
double RoleBonus(SourceRole role);

/**
 * Strict ordering used to pick cluster representatives: higher score, then
 * longer normalized text, then lower sequence index.
 */
bool Outranks(const PriorityScore& a, const PriorityScore& b);

/**
 * Deterministic scorer. Entity and temporal-marker counts come from the
 * counter; a null counter (or one that throws) contributes zero.
 */
class PriorityScorer {
 public:
  static constexpr double kLengthDivisor = 100.0;
  static constexpr double kEntityWeight = 10.0;
  static constexpr double kTemporalWeight = 5.0;
  static constexpr double kOperativeMentionBonus = 15.0;

  explicit PriorityScorer(std::shared_ptr<const EntityCounter> counter = nullptr);

  PriorityScore Score(const Note& note, const NormalizedText& normalized) const;

 private:
  std::shared_ptr<const EntityCounter> counter_;
};

}  // namespace condense
