#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace condense {

/** Who authored a note. Resolved once at ingestion, never re-inferred. */
enum class SourceRole {
  kAttending,
  kResident,
  kConsultant,
  kPtOt,        // physical / occupational therapy
  kOperative,   // operative or procedure note
  kUnknown
};

/**
 * Resolve a free-form label ("Attending Note", "PT consult", "Brief Op Note")
 * to a SourceRole. Canonical names ("attending", "pt_ot", ...) round-trip.
 * Therapy keywords are checked before "consult" so "PT consult" is kPtOt.
 * Unrecognized or empty labels map to kUnknown.
 */
SourceRole ParseSourceRole(std::string_view label);

/** Canonical lowercase name: attending, resident, consultant, pt_ot, operative, unknown. */
std::string_view SourceRoleName(SourceRole role);

/**
 * One raw note as handed to the pipeline.
 *
 * Every field is optional. A note without text is an input error and is
 * skipped; missing role means kUnknown, missing sequence index means the
 * note's position in the input list, missing id means "note-<position>".
 */
struct NoteInput {
  std::optional<std::string> text;
  std::optional<std::string> role;
  std::optional<int64_t> sequence_index;
  std::optional<std::string> id;

  NoteInput() = default;
  explicit NoteInput(std::string t) : text(std::move(t)) {}
  NoteInput(std::string t, std::string r) : text(std::move(t)), role(std::move(r)) {}
};

/** An ingested note. Immutable once created. */
struct Note {
  std::string id;
  std::string raw_text;
  SourceRole source_role = SourceRole::kUnknown;
  int64_t sequence_index = 0;
};

}  // namespace condense
