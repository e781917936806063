#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace condense {

/**
 * Normalized view of a note or sentence. Derived once, never mutated.
 *
 * `text` is the comparison form: typographic characters folded to ASCII,
 * clinical shorthand expanded ("Pt" -> "patient", "s/p" -> "status post"),
 * lowercased, punctuation replaced by spaces, letters and digits split apart
 * ("POD#3" -> "pod 3"), whitespace collapsed.
 */
struct NormalizedText {
  std::string text;
  std::vector<std::string> words;       // `text` split on spaces, in order
  std::vector<std::string> vocabulary;  // distinct words, sorted
  std::vector<std::string> sentences;   // sentence display text, original wording
};

/**
 * Normalize a whole note: fold typography, remove boilerplate (note-type
 * headers, Date:/Time:/MRN: lines, signature lines), split sentences, then
 * derive the comparison form of what remains.
 */
NormalizedText NormalizeNote(std::string_view raw);

/**
 * Normalize a fragment (typically one sentence) without boilerplate removal
 * or sentence splitting. `sentences` holds the trimmed fragment itself.
 */
NormalizedText NormalizeFragment(std::string_view raw);

namespace internal {

/** Map typographic punctuation, ligatures and Latin-1 capitals to ASCII / lowercase. */
std::string FoldTypography(std::string_view input);

/** Remove header/footer boilerplate lines. Input should already be folded. */
std::string StripBoilerplate(std::string_view input);

/** Expand clinical shorthand token by token. Case matters ("PT" vs "pt"). */
std::string ExpandAbbreviations(std::string_view input);

/** Produce the comparison form of already folded text. */
std::string ComparisonForm(std::string_view input);

/**
 * Split into sentences. Line breaks always end a sentence; ". ", "! " and
 * "? " end one unless the period closes a protected abbreviation
 * (Dr., vs., e.g., POD., CT., ...). Each sentence keeps its terminator.
 */
std::vector<std::string> SplitSentences(std::string_view text);

/**
 * Inverse of SplitSentences for retained sentences: a sentence ending in
 * terminal punctuation is followed by a space, otherwise by a newline, so
 * re-splitting the result yields the same sentences.
 */
std::string JoinSentences(const std::vector<std::string>& sentences);

}  // namespace internal
}  // namespace condense
