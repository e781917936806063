#pragma once

#define CONDENSE_VERSION_MAJOR 0
#define CONDENSE_VERSION_MINOR 1
#define CONDENSE_VERSION_PATCH 0

#define CONDENSE_VERSION_STRING "0.1.0"

// For compile-time version checks
#define CONDENSE_VERSION \
  (CONDENSE_VERSION_MAJOR * 10000 + CONDENSE_VERSION_MINOR * 100 + CONDENSE_VERSION_PATCH)

namespace condense {

inline const char* Version() { return CONDENSE_VERSION_STRING; }

// Version of the built-in concept table (bumped whenever an entry changes,
// since it changes semantic scores).
constexpr int kConceptLexiconVersion = 1;

}  // namespace condense
