#pragma once

#include <condense/pipeline.hpp>

#include <string>

namespace condense::cli {

/**
 * Complete command-line tool configuration.
 *
 * Config file format (YAML-like):
 *   input: notes.json
 *   similarity:
 *     jaccard: 0.4
 *     levenshtein: 0.2
 *     semantic: 0.4
 *   pipeline:
 *     threshold_near: 0.85
 *     num_threads: 4
 *   logging:
 *     level: info
 */
struct Config {
  condense::Options pipeline;

  // "keyword" (KeywordEntityCounter) or "none" (zero counts).
  std::string entity_counter = "keyword";

  std::string input_path;   // "-" reads stdin
  std::string output_path;  // empty writes stdout
  bool pretty = false;
  std::string log_level = "warn";

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or a value cannot be parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments. A --config file is
   * applied first; every other flag overrides it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

/** Print usage to stderr. */
void PrintUsage(const char* argv0);

}  // namespace condense::cli
