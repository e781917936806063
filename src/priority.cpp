#include <condense/priority.hpp>

#include <algorithm>
#include <array>
#include <exception>
#include <string_view>
#include <utility>

#include <trantor/utils/Logger.h>

namespace condense {

namespace {

// Words (in comparison form) that mark operative content regardless of role.
constexpr std::array<std::string_view, 4> kOperativeWords = {
    "operative", "postoperative", "intraoperative", "procedure"};

size_t CountOperativeMentions(const NormalizedText& normalized) {
  size_t n = 0;
  for (auto word : kOperativeWords) {
    if (std::binary_search(normalized.vocabulary.begin(), normalized.vocabulary.end(),
                           std::string(word))) {
      ++n;
    }
  }
  return n;
}

}  // namespace

double RoleBonus(SourceRole role) {
  switch (role) {
    case SourceRole::kConsultant:
      return 30.0;
    case SourceRole::kAttending:
      return 20.0;
    case SourceRole::kOperative:
      return 15.0;
    default:
      return 0.0;
  }
}

bool Outranks(const PriorityScore& a, const PriorityScore& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.normalized_length != b.normalized_length) {
    return a.normalized_length > b.normalized_length;
  }
  return a.sequence_index < b.sequence_index;
}

PriorityScorer::PriorityScorer(std::shared_ptr<const EntityCounter> counter)
    : counter_(std::move(counter)) {}

PriorityScore PriorityScorer::Score(const Note& note, const NormalizedText& normalized) const {
  PriorityScore p;
  p.note_id = note.id;
  p.raw_length = note.raw_text.size();
  p.normalized_length = normalized.text.size();
  p.sequence_index = note.sequence_index;
  p.role_bonus = RoleBonus(note.source_role);
  p.operative_mention_bonus =
      kOperativeMentionBonus * static_cast<double>(CountOperativeMentions(normalized));

  if (counter_) {
    try {
      p.entity_count = counter_->CountEntities(note.raw_text);
      p.temporal_marker_count = counter_->CountTemporalMarkers(note.raw_text);
    } catch (const std::exception& e) {
      LOG_WARN << "entity counter failed for note " << note.id << ": " << e.what();
      p.entity_count = 0;
      p.temporal_marker_count = 0;
    }
  }

  p.score = static_cast<double>(p.raw_length) / kLengthDivisor +
            static_cast<double>(p.entity_count) * kEntityWeight +
            static_cast<double>(p.temporal_marker_count) * kTemporalWeight + p.role_bonus +
            p.operative_mention_bonus;
  return p;
}

}  // namespace condense
