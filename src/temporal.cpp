#include <condense/temporal.hpp>

#include <algorithm>
#include <regex>
#include <utility>

namespace condense {

namespace {

std::string StripZeros(const std::string& s) {
  size_t i = 0;
  while (i + 1 < s.size() && s[i] == '0') ++i;
  return s.substr(i);
}

std::string CanonicalYear(const std::string& y) {
  if (y.size() == 2) return "20" + y;
  return y;
}

std::string Lower(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

const std::regex& UsDateRegex() {
  static const std::regex re(R"(\b(\d{1,2})[/-](\d{1,2})[/-](\d{4}|\d{2})\b)");
  return re;
}

const std::regex& IsoDateRegex() {
  static const std::regex re(R"(\b(\d{4})-(\d{1,2})-(\d{1,2})\b)");
  return re;
}

const std::regex& PostOpDayRegex() {
  static const std::regex re(
      R"(\b(?:pod|post[- ]?op(?:erative)?[ ]+day)[ ]*#?[ ]*(\d{1,3})\b)", std::regex::icase);
  return re;
}

const std::regex& HospitalDayRegex() {
  static const std::regex re(R"(\b(?:hd|hospital[ ]+day)[ ]*#?[ ]*(\d{1,3})\b)",
                             std::regex::icase);
  return re;
}

const std::regex& RelativeRegex() {
  static const std::regex re(
      R"(\b(today|yesterday|tonight|overnight|this morning|last night)\b)", std::regex::icase);
  return re;
}

template <typename Fn>
void ForEachMatch(const std::string& text, const std::regex& re, Fn&& fn) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
       it != std::sregex_iterator(); ++it) {
    fn(*it);
  }
}

}  // namespace

std::vector<TemporalMarker> ExtractTemporalMarkers(std::string_view text) {
  const std::string s(text);
  std::set<TemporalMarker> found;

  ForEachMatch(s, UsDateRegex(), [&](const std::smatch& m) {
    found.insert({TemporalKind::kDate, StripZeros(m[1].str()) + "/" + StripZeros(m[2].str()) +
                                           "/" + CanonicalYear(m[3].str())});
  });
  ForEachMatch(s, IsoDateRegex(), [&](const std::smatch& m) {
    found.insert({TemporalKind::kDate,
                  StripZeros(m[2].str()) + "/" + StripZeros(m[3].str()) + "/" + m[1].str()});
  });
  ForEachMatch(s, PostOpDayRegex(), [&](const std::smatch& m) {
    found.insert({TemporalKind::kPostOpDay, "pod " + StripZeros(m[1].str())});
  });
  ForEachMatch(s, HospitalDayRegex(), [&](const std::smatch& m) {
    found.insert({TemporalKind::kHospitalDay, "hd " + StripZeros(m[1].str())});
  });
  ForEachMatch(s, RelativeRegex(), [&](const std::smatch& m) {
    found.insert({TemporalKind::kRelative, Lower(m[1].str())});
  });

  return std::vector<TemporalMarker>(found.begin(), found.end());
}

std::set<std::string> TemporalAnchors(std::string_view text) {
  std::set<std::string> anchors;
  for (auto& marker : ExtractTemporalMarkers(text)) {
    if (marker.kind != TemporalKind::kRelative) anchors.insert(std::move(marker.value));
  }
  return anchors;
}

}  // namespace condense
