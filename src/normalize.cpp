#include <condense/normalize.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <unordered_map>

namespace condense {
namespace internal {

namespace {

// Typographic sequences folded before anything else looks at the text.
// Format: { src_bytes, src_len, dst, dst_len }
struct TypographyMapping {
  uint8_t src[4];
  uint8_t src_len;
  const char* dst;
  uint8_t dst_len;
};

constexpr TypographyMapping kTypographyMappings[] = {
    {{0xC2, 0xA0, 0, 0}, 2, " ", 1},        // no-break space
    {{0xC2, 0xB0, 0, 0}, 2, " ", 1},        // degree sign
    {{0xC2, 0xB1, 0, 0}, 2, "+/-", 3},      // plus-minus
    {{0xC2, 0xB2, 0, 0}, 2, "2", 1},        // superscript 2
    {{0xC2, 0xB3, 0, 0}, 2, "3", 1},        // superscript 3
    {{0xC2, 0xB5, 0, 0}, 2, "u", 1},        // micro sign (mcg)
    {{0xC2, 0xB7, 0, 0}, 2, " ", 1},        // middle dot
    {{0xC2, 0xB9, 0, 0}, 2, "1", 1},        // superscript 1
    {{0xC2, 0xBC, 0, 0}, 2, "1/4", 3},
    {{0xC2, 0xBD, 0, 0}, 2, "1/2", 3},
    {{0xC2, 0xBE, 0, 0}, 2, "3/4", 3},
    {{0xC3, 0x97, 0, 0}, 2, "x", 1},        // multiplication sign (3 x 4 cm)

    {{0xE2, 0x80, 0x90, 0}, 3, "-", 1},     // hyphen
    {{0xE2, 0x80, 0x91, 0}, 3, "-", 1},     // non-breaking hyphen
    {{0xE2, 0x80, 0x92, 0}, 3, "-", 1},     // figure dash
    {{0xE2, 0x80, 0x93, 0}, 3, "-", 1},     // en dash
    {{0xE2, 0x80, 0x94, 0}, 3, "-", 1},     // em dash
    {{0xE2, 0x80, 0x95, 0}, 3, "-", 1},     // horizontal bar
    {{0xE2, 0x80, 0x98, 0}, 3, "'", 1},     // left single quote
    {{0xE2, 0x80, 0x99, 0}, 3, "'", 1},     // right single quote
    {{0xE2, 0x80, 0x9C, 0}, 3, "\"", 1},    // left double quote
    {{0xE2, 0x80, 0x9D, 0}, 3, "\"", 1},    // right double quote
    {{0xE2, 0x80, 0xA2, 0}, 3, "\n", 1},    // bullet starts a new item
    {{0xE2, 0x80, 0xA6, 0}, 3, "...", 3},   // ellipsis
    {{0xE2, 0x80, 0xAF, 0}, 3, " ", 1},     // narrow no-break space
    {{0xE2, 0x86, 0x92, 0}, 3, "->", 2},    // rightwards arrow
    {{0xE2, 0x86, 0x91, 0}, 3, " up ", 4},  // upwards arrow (trend)
    {{0xE2, 0x86, 0x93, 0}, 3, " down ", 6},
    {{0xE2, 0x89, 0xA4, 0}, 3, "<=", 2},
    {{0xE2, 0x89, 0xA5, 0}, 3, ">=", 2},

    // Latin ligatures U+FB00-FB04
    {{0xEF, 0xAC, 0x80, 0}, 3, "ff", 2},
    {{0xEF, 0xAC, 0x81, 0}, 3, "fi", 2},
    {{0xEF, 0xAC, 0x82, 0}, 3, "fl", 2},
    {{0xEF, 0xAC, 0x83, 0}, 3, "ffi", 3},
    {{0xEF, 0xAC, 0x84, 0}, 3, "ffl", 3},
};

constexpr size_t kTypographyMappingsCount =
    sizeof(kTypographyMappings) / sizeof(kTypographyMappings[0]);

inline int UTF8ByteLength(uint8_t first_byte) {
  if ((first_byte & 0x80) == 0) return 1;
  if ((first_byte & 0xE0) == 0xC0) return 2;
  if ((first_byte & 0xF0) == 0xE0) return 3;
  if ((first_byte & 0xF8) == 0xF0) return 4;
  return 1;  // invalid, treat as single byte
}

const TypographyMapping* FindTypographyMapping(const uint8_t* src, size_t max_len) {
  for (size_t i = 0; i < kTypographyMappingsCount; ++i) {
    const auto& m = kTypographyMappings[i];
    if (max_len >= m.src_len && std::memcmp(src, m.src, m.src_len) == 0) return &m;
  }
  return nullptr;
}

inline bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline bool IsAsciiAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }

inline char AsciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string Lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = AsciiLower(c);
  return out;
}

std::string_view TrimView(std::string_view s) {
  size_t b = 0;
  while (b < s.size() && IsSpace(s[b])) ++b;
  size_t e = s.size();
  while (e > b && IsSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
  if (s.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (AsciiLower(s[i]) != AsciiLower(prefix[i])) return false;
  }
  return true;
}

size_t FindNoCase(std::string_view haystack, std::string_view needle, size_t from = 0) {
  if (needle.empty() || haystack.size() < needle.size()) return std::string_view::npos;
  for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
    if (StartsWithNoCase(haystack.substr(i), needle)) return i;
  }
  return std::string_view::npos;
}

// ---------------------------------------------------------------------------
// Boilerplate
// ---------------------------------------------------------------------------

// Note-type titles, matched as written in capitals. The first one, and
// whatever precedes it on its line, is header.
constexpr const char* kNoteTitles[] = {
    "PROGRESS NOTE", "ADMISSION NOTE", "OPERATIVE NOTE", "CONSULTATION NOTE",
    "CONSULT NOTE", "DISCHARGE SUMMARY", "HISTORY AND PHYSICAL",
};

// Lines starting with these labels carry no clinical content.
constexpr const char* kHeaderLabels[] = {
    "Date:", "Time:", "Date/Time:", "Attending:", "Resident:",
    "Medical Record Number:", "MRN:", "DOB:", "Date of Birth:",
    "Patient Name:", "Account #:", "FIN:",
};

// Signature phrases: the phrase and the rest of its line are dropped.
constexpr const char* kSignaturePhrases[] = {
    "Electronically signed by", "Dictated by", "Transcribed by",
};

bool IsSeparatorLine(std::string_view line) {
  if (line.empty()) return false;
  for (char c : line) {
    if (c != '-' && c != '=' && c != '*' && c != '_' && c != '#' && c != '~' && !IsSpace(c)) {
      return false;
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Abbreviations
// ---------------------------------------------------------------------------

// Matched against the token exactly as written.
const std::unordered_map<std::string, std::string>& CaseSensitiveExpansions() {
  static const std::unordered_map<std::string, std::string> table = {
      {"PT", "physical therapy"},
      {"OT", "occupational therapy"},
      {"PT/OT", "physical therapy and occupational therapy"},
  };
  return table;
}

// Matched against the lowercased token.
const std::unordered_map<std::string, std::string>& Expansions() {
  static const std::unordered_map<std::string, std::string> table = {
      {"pt", "patient"},
      {"pts", "patients"},
      {"s/p", "status post"},
      {"w/", "with"},
      {"w/o", "without"},
      {"h/o", "history of"},
      {"c/o", "complains of"},
      {"f/u", "follow up"},
      {"b/l", "bilateral"},
      {"r/o", "rule out"},
      {"y/o", "year old"},
      {"yo", "year old"},
      {"d/c", "discharge"},
      {"n/v", "nausea and vomiting"},
      {"hx", "history"},
      {"dx", "diagnosis"},
      {"tx", "treatment"},
      {"sx", "symptoms"},
      {"fx", "fracture"},
      {"abx", "antibiotics"},
      {"wnl", "within normal limits"},
      {"postop", "postoperative"},
      {"post-op", "postoperative"},
      {"preop", "preoperative"},
      {"pre-op", "preoperative"},
      {"intraop", "intraoperative"},
      {"intra-op", "intraoperative"},
  };
  return table;
}

bool IsLeadingPunct(char c) {
  return c == '(' || c == '[' || c == '{' || c == '"' || c == '\'';
}

bool IsTrailingPunct(char c) {
  return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?' ||
         c == ')' || c == ']' || c == '}' || c == '"' || c == '\'';
}

// ---------------------------------------------------------------------------
// Sentences
// ---------------------------------------------------------------------------

// A period after one of these does not end a sentence.
constexpr const char* kProtectedAbbreviations[] = {
    "dr", "mr", "mrs", "ms", "vs", "etc", "e.g", "i.e", "pod", "hd",
    "ct", "mri", "eeg", "lp", "st", "jr", "approx", "a.m", "p.m",
};

inline bool IsTerminator(char c) { return c == '.' || c == '!' || c == '?'; }

// True if the terminator run ending at `end` (exclusive) closes the sentence.
// `start` is where the run begins.
bool ClosesSentence(std::string_view text, size_t start) {
  if (text[start] != '.') return true;  // '!' or '?' always closes
  if (start + 1 < text.size() && text[start + 1] == '.') return true;  // "..."
  size_t b = start;
  while (b > 0 && !IsSpace(text[b - 1]) && text[b - 1] != '(') --b;
  const std::string word = Lower(text.substr(b, start - b));
  for (const char* abbr : kProtectedAbbreviations) {
    if (word == abbr) return false;
  }
  return true;
}

void SplitLine(std::string_view line, std::vector<std::string>* out) {
  size_t sentence_start = 0;
  size_t i = 0;
  while (i < line.size()) {
    if (!IsTerminator(line[i])) {
      ++i;
      continue;
    }
    const size_t run_start = i;
    while (i < line.size() && IsTerminator(line[i])) ++i;
    // Closing quotes/brackets stay with the sentence they close.
    while (i < line.size() && (line[i] == '"' || line[i] == '\'' || line[i] == ')')) ++i;
    const bool at_break = i >= line.size() || IsSpace(line[i]);
    if (at_break && ClosesSentence(line, run_start)) {
      auto sentence = TrimView(line.substr(sentence_start, i - sentence_start));
      if (!sentence.empty()) out->emplace_back(sentence);
      sentence_start = i;
    }
  }
  auto tail = TrimView(line.substr(sentence_start));
  if (!tail.empty()) out->emplace_back(tail);
}

bool EndsWithClosingTerminator(std::string_view sentence) {
  size_t end = sentence.size();
  while (end > 0 && (sentence[end - 1] == '"' || sentence[end - 1] == '\'' ||
                     sentence[end - 1] == ')')) {
    --end;
  }
  if (end == 0 || !IsTerminator(sentence[end - 1])) return false;
  size_t run_start = end - 1;
  while (run_start > 0 && IsTerminator(sentence[run_start - 1])) --run_start;
  return ClosesSentence(sentence, run_start);
}

void SplitWords(const std::string& text, std::vector<std::string>* words) {
  size_t pos = 0;
  while (pos < text.size()) {
    size_t next = text.find(' ', pos);
    if (next == std::string::npos) next = text.size();
    if (next > pos) words->emplace_back(text.substr(pos, next - pos));
    pos = next + 1;
  }
}

NormalizedText Build(std::string comparison, std::vector<std::string> sentences) {
  NormalizedText out;
  out.text = std::move(comparison);
  SplitWords(out.text, &out.words);
  out.vocabulary = out.words;
  std::sort(out.vocabulary.begin(), out.vocabulary.end());
  out.vocabulary.erase(std::unique(out.vocabulary.begin(), out.vocabulary.end()),
                       out.vocabulary.end());
  out.sentences = std::move(sentences);
  return out;
}

}  // namespace

std::string FoldTypography(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    const uint8_t c = static_cast<uint8_t>(input[i]);
    if (c < 0x80) {
      result += static_cast<char>(c);
      ++i;
      continue;
    }

    const TypographyMapping* mapping = FindTypographyMapping(
        reinterpret_cast<const uint8_t*>(input.data() + i), input.size() - i);
    if (mapping) {
      result.append(mapping->dst, mapping->dst_len);
      i += mapping->src_len;
      continue;
    }

    // Latin-1 capitals (U+00C0-U+00DE, encoded 0xC3 0x80-0x9E) fold to lowercase
    // by adding 0x20 to the second byte.
    if (c == 0xC3 && i + 1 < input.size()) {
      const uint8_t c2 = static_cast<uint8_t>(input[i + 1]);
      if (c2 >= 0x80 && c2 <= 0x9E) {
        result += static_cast<char>(0xC3);
        result += static_cast<char>(c2 + 0x20);
        i += 2;
        continue;
      }
    }

    // Pass through unrecognized UTF-8 sequences unchanged
    const int byte_len = UTF8ByteLength(c);
    for (int j = 0; j < byte_len && i < input.size(); ++j) {
      result += input[i++];
    }
  }
  return result;
}

std::string StripBoilerplate(std::string_view input) {
  std::string text(input);

  // Header: the first note-type title and the start of its line.
  size_t best = std::string::npos;
  size_t best_len = 0;
  for (const char* title : kNoteTitles) {
    const size_t pos = text.find(title);
    if (pos != std::string::npos && (best == std::string::npos || pos < best)) {
      best = pos;
      best_len = std::strlen(title);
    }
  }
  if (best != std::string::npos) {
    const size_t line_start = text.rfind('\n', best);
    const size_t from = line_start == std::string::npos ? 0 : line_start + 1;
    text.erase(from, best + best_len - from);
  }

  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t eol = text.find('\n', pos);
    if (eol == std::string::npos) eol = text.size();
    std::string_view line(text.data() + pos, eol - pos);
    pos = eol + 1;

    for (const char* phrase : kSignaturePhrases) {
      const size_t at = FindNoCase(line, phrase);
      if (at != std::string_view::npos) line = line.substr(0, at);
    }

    const auto trimmed = TrimView(line);
    bool drop = IsSeparatorLine(trimmed);
    for (const char* label : kHeaderLabels) {
      if (StartsWithNoCase(trimmed, label)) drop = true;
    }
    if (trimmed.empty() || drop) continue;

    if (!out.empty()) out += '\n';
    out.append(trimmed.data(), trimmed.size());
  }
  return out;
}

std::string ExpandAbbreviations(std::string_view input) {
  const auto& exact = CaseSensitiveExpansions();
  const auto& folded = Expansions();

  std::string out;
  out.reserve(input.size() + input.size() / 8);

  size_t i = 0;
  while (i < input.size()) {
    if (IsSpace(input[i])) {
      out += input[i++];
      continue;
    }
    size_t end = i;
    while (end < input.size() && !IsSpace(input[end])) ++end;
    std::string_view token = input.substr(i, end - i);
    i = end;

    size_t lead = 0;
    while (lead < token.size() && IsLeadingPunct(token[lead])) ++lead;
    size_t trail = token.size();
    while (trail > lead && IsTrailingPunct(token[trail - 1])) --trail;
    const std::string core(token.substr(lead, trail - lead));

    auto it = exact.find(core);
    if (it == exact.end()) {
      it = folded.find(Lower(core));
      if (it == folded.end()) {
        out.append(token.data(), token.size());
        continue;
      }
    }
    out.append(token.data(), lead);
    out += it->second;
    out.append(token.data() + trail, token.size() - trail);
  }
  return out;
}

std::string ComparisonForm(std::string_view input) {
  const std::string expanded = ExpandAbbreviations(input);

  std::string out;
  out.reserve(expanded.size());
  // 0 = separator, 1 = letter, 2 = digit
  int prev_kind = 0;
  for (char ch : expanded) {
    const uint8_t c = static_cast<uint8_t>(ch);
    if (ch == '\'' || ch == '`') continue;  // "patient's" -> "patients"

    int kind = 0;
    if (IsAsciiDigit(ch)) {
      kind = 2;
    } else if (IsAsciiAlpha(ch) || c >= 0x80) {
      kind = 1;
    }

    if (kind == 0) {
      if (!out.empty() && out.back() != ' ') out += ' ';
      prev_kind = 0;
      continue;
    }
    if (prev_kind != 0 && prev_kind != kind) out += ' ';
    out += AsciiLower(ch);
    prev_kind = kind;
  }
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::vector<std::string> SplitSentences(std::string_view text) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) eol = text.size();
    SplitLine(text.substr(pos, eol - pos), &out);
    pos = eol + 1;
  }
  return out;
}

std::string JoinSentences(const std::vector<std::string>& sentences) {
  std::string out;
  for (size_t i = 0; i < sentences.size(); ++i) {
    if (i > 0) out += EndsWithClosingTerminator(sentences[i - 1]) ? ' ' : '\n';
    out += sentences[i];
  }
  return out;
}

}  // namespace internal

NormalizedText NormalizeNote(std::string_view raw) {
  const std::string body = internal::StripBoilerplate(internal::FoldTypography(raw));
  return internal::Build(internal::ComparisonForm(body), internal::SplitSentences(body));
}

NormalizedText NormalizeFragment(std::string_view raw) {
  const std::string folded = internal::FoldTypography(raw);
  std::vector<std::string> sentences;
  const auto trimmed = internal::TrimView(folded);
  if (!trimmed.empty()) sentences.emplace_back(trimmed);
  return internal::Build(internal::ComparisonForm(folded), std::move(sentences));
}

}  // namespace condense
