#include <condense/note.hpp>

#include <cctype>
#include <string>

namespace condense {

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

// True if `word` appears in `s` delimited by non-letters.
bool ContainsWord(const std::string& s, std::string_view word) {
  size_t pos = s.find(word);
  while (pos != std::string::npos) {
    const bool left_ok = pos == 0 || !std::isalpha(static_cast<unsigned char>(s[pos - 1]));
    const size_t end = pos + word.size();
    const bool right_ok = end >= s.size() || !std::isalpha(static_cast<unsigned char>(s[end]));
    if (left_ok && right_ok) return true;
    pos = s.find(word, pos + 1);
  }
  return false;
}

}  // namespace

SourceRole ParseSourceRole(std::string_view label) {
  const std::string s = Lower(label);
  if (s.empty()) return SourceRole::kUnknown;

  // Canonical names first.
  if (s == "attending") return SourceRole::kAttending;
  if (s == "resident") return SourceRole::kResident;
  if (s == "consultant") return SourceRole::kConsultant;
  if (s == "pt_ot") return SourceRole::kPtOt;
  if (s == "operative") return SourceRole::kOperative;
  if (s == "unknown") return SourceRole::kUnknown;

  if (ContainsWord(s, "pt") || ContainsWord(s, "ot") || ContainsWord(s, "pt/ot") ||
      Contains(s, "physical therap") || Contains(s, "occupational therap") ||
      Contains(s, "rehab")) {
    return SourceRole::kPtOt;
  }
  if (Contains(s, "operative") || ContainsWord(s, "op") || Contains(s, "procedure")) {
    return SourceRole::kOperative;
  }
  if (Contains(s, "consult")) return SourceRole::kConsultant;
  if (Contains(s, "attending")) return SourceRole::kAttending;
  if (Contains(s, "resident") || ContainsWord(s, "intern") || Contains(s, "house staff")) {
    return SourceRole::kResident;
  }
  return SourceRole::kUnknown;
}

std::string_view SourceRoleName(SourceRole role) {
  switch (role) {
    case SourceRole::kAttending:  return "attending";
    case SourceRole::kResident:   return "resident";
    case SourceRole::kConsultant: return "consultant";
    case SourceRole::kPtOt:       return "pt_ot";
    case SourceRole::kOperative:  return "operative";
    case SourceRole::kUnknown:    return "unknown";
  }
  return "unknown";
}

}  // namespace condense
