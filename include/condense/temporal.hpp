#pragma once

#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace condense {

enum class TemporalKind {
  kDate,          // calendar date, canonical "m/d/yyyy"
  kPostOpDay,     // "pod <n>"
  kHospitalDay,   // "hd <n>"
  kRelative       // today, yesterday, overnight, ...
};

struct TemporalMarker {
  TemporalKind kind = TemporalKind::kRelative;
  std::string value;

  bool operator<(const TemporalMarker& o) const {
    return std::tie(kind, value) < std::tie(o.kind, o.value);
  }
  bool operator==(const TemporalMarker& o) const {
    return kind == o.kind && value == o.value;
  }
};

/**
 * Extract distinct temporal markers from raw note text, in canonical form.
 *
 * Recognized: numeric dates (10/01/2024, 10-1-24, 2024-10-01), postoperative
 * days (POD 3, POD#3, postoperative day 3, post-op day 3), hospital days
 * (HD 2, hospital day 2) and relative words (today, yesterday, overnight,
 * this morning, last night, tonight).
 */
std::vector<TemporalMarker> ExtractTemporalMarkers(std::string_view text);

/**
 * The subset of markers that anchor a note to a specific day (dates, POD, HD),
 * as canonical strings. Relative words are excluded.
 */
std::set<std::string> TemporalAnchors(std::string_view text);

}  // namespace condense
