#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

#include <condense/note.hpp>
#include <condense/pipeline.hpp>

namespace condense {

/**
 * Parse a JSON note list.
 *
 * Accepted shapes:
 *   ["text", {"text": "...", "sourceRole": "attending", "sequenceIndex": 3, "id": "n1"}, ...]
 *   {"notes": [ ...same elements... ]}
 *
 * "role" is accepted as an alias of "sourceRole". An element whose text is
 * missing or not a string yields a NoteInput without text, which the
 * pipeline skips. Malformed JSON or an unexpected top-level shape returns
 * InvalidArgument.
 */
rocksdb::Status ParseNoteInputs(std::string_view json, std::vector<NoteInput>* out);

/** Serialize a result with camelCase field names. */
std::string ResultToJson(const DeduplicationResult& result, bool pretty = false);

/** Serialize a similarity score: {"jaccard", "levenshtein", "semantic", "combined"}. */
std::string ScoreToJson(const SimilarityScore& score, bool pretty = false);

}  // namespace condense
