#include <condense/cli/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace condense::cli {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

double ParseDouble(const std::string& key, const std::string& value) {
  size_t used = 0;
  double d = 0.0;
  try {
    d = std::stod(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
  if (used != value.size()) {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
  return d;
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  const std::string error = "Invalid non-negative integer for " + key + ": " + value;
  if (value.empty() || value[0] == '-') throw std::runtime_error(error);
  size_t used = 0;
  unsigned long long n = 0;
  try {
    n = std::stoull(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error(error);
  }
  if (used != value.size()) throw std::runtime_error(error);
  return static_cast<uint64_t>(n);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

// "0.4,0.2,0.4" -> jaccard, levenshtein, semantic
SimilarityWeights ParseWeights(const std::string& value) {
  SimilarityWeights w;
  size_t first = value.find(',');
  size_t second = first == std::string::npos ? std::string::npos : value.find(',', first + 1);
  if (first == std::string::npos || second == std::string::npos) {
    throw std::runtime_error("--weights expects jaccard,levenshtein,semantic: " + value);
  }
  w.jaccard = ParseDouble("weights.jaccard", Trim(value.substr(0, first)));
  w.levenshtein = ParseDouble("weights.levenshtein", Trim(value.substr(first + 1, second - first - 1)));
  w.semantic = ParseDouble("weights.semantic", Trim(value.substr(second + 1)));
  return w;
}

void ApplySimilarityKey(Config* config, const std::string& key, const std::string& value) {
  auto& opt = config->pipeline;
  if (key == "jaccard") {
    opt.weights.jaccard = ParseDouble("similarity.jaccard", value);
  } else if (key == "levenshtein") {
    opt.weights.levenshtein = ParseDouble("similarity.levenshtein", value);
  } else if (key == "semantic") {
    opt.weights.semantic = ParseDouble("similarity.semantic", value);
  } else if (key == "levenshtein_max_chars") {
    opt.levenshtein_max_chars = ParseUnsigned("similarity.levenshtein_max_chars", value);
  }
}

void ApplyPipelineKey(Config* config, const std::string& key, const std::string& value) {
  auto& opt = config->pipeline;
  if (key == "threshold_near") {
    opt.threshold_near = ParseDouble("pipeline.threshold_near", value);
  } else if (key == "threshold_sentence") {
    opt.threshold_sentence = ParseDouble("pipeline.threshold_sentence", value);
  } else if (key == "complementary_low") {
    opt.complementary_low = ParseDouble("pipeline.complementary_low", value);
  } else if (key == "complementary_high") {
    opt.complementary_high = ParseDouble("pipeline.complementary_high", value);
  } else if (key == "preserve_chronology") {
    opt.preserve_chronology = ParseBool("pipeline.preserve_chronology", value);
  } else if (key == "merge_complementary") {
    opt.merge_complementary = ParseBool("pipeline.merge_complementary", value);
  } else if (key == "min_sentence_chars") {
    opt.min_sentence_chars = ParseUnsigned("pipeline.min_sentence_chars", value);
  } else if (key == "num_threads") {
    opt.num_threads = ParseUnsigned("pipeline.num_threads", value);
  } else if (key == "timeout_ms") {
    opt.timeout_ms = ParseUnsigned("pipeline.timeout_ms", value);
  } else if (key == "entity_counter") {
    config->entity_counter = value;
  }
}

void LoadInto(const std::string& path, Config* config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) continue;

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Unquote(Trim(line.substr(colon_pos + 1)));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    if (current_section == "similarity") {
      ApplySimilarityKey(config, key, value);
    } else if (current_section == "pipeline") {
      ApplyPipelineKey(config, key, value);
    } else if (current_section == "logging") {
      if (key == "level") config->log_level = value;
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "input") {
        config->input_path = value;
      } else if (key == "output") {
        config->output_path = value;
      } else if (key == "pretty") {
        config->pretty = ParseBool("pretty", value);
      }
    }
  }
}

const char* NextValue(int argc, char** argv, int* i, const std::string& flag) {
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires a value");
  }
  return argv[*i];
}

}  // namespace

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <notes.json | ->\n"
            << "\nReads a JSON array of notes and writes the deduplicated result as JSON.\n"
            << "\nOptions:\n"
            << "  --config, -c <path>          Path to YAML config file\n"
            << "  --output, -o <path>          Write result here (default: stdout)\n"
            << "  --pretty                     Indent JSON output\n"
            << "  --weights <j,l,s>            Similarity weights (default: 0.4,0.2,0.4)\n"
            << "  --threshold-near <x>         Near-duplicate threshold (default: 0.85)\n"
            << "  --threshold-sentence <x>     Sentence duplicate threshold (default: 0.85)\n"
            << "  --complementary-low <x>      Merge band lower bound (default: 0.30)\n"
            << "  --complementary-high <x>     Merge band upper bound (default: 0.60)\n"
            << "  --no-merge                   Skip complementary merging\n"
            << "  --no-chronology              Order output by representative index\n"
            << "  --min-sentence-chars <n>     Fuzzy sentence comparison floor (default: 10)\n"
            << "  --levenshtein-max-chars <n>  Edit distance prefix bound, 0=unbounded (default: 0)\n"
            << "  --threads <n>                Comparison threads (default: 1)\n"
            << "  --timeout-ms <n>             Run deadline, 0 = none (default: 0)\n"
            << "  --entity-counter <name>      keyword or none (default: keyword)\n"
            << "  --log-level <level>          Log level: debug, info, warn, error\n"
            << "  --help, -h                   Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " notes.json --pretty\n"
            << "  cat notes.json | " << argv0 << " - --threads 4 --timeout-ms 500\n"
            << "  " << argv0 << " --config /etc/condense/condense.yaml notes.json\n";
}

Config Config::LoadFromFile(const std::string& path) {
  Config config;
  LoadInto(path, &config);
  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;

  // The config file is applied first so flags override it regardless of order.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      LoadInto(NextValue(argc, argv, &i, arg), &config);
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;  // already applied
    } else if (arg == "--output" || arg == "-o") {
      config.output_path = NextValue(argc, argv, &i, arg);
    } else if (arg == "--pretty") {
      config.pretty = true;
    } else if (arg == "--weights") {
      config.pipeline.weights = ParseWeights(NextValue(argc, argv, &i, arg));
    } else if (arg == "--threshold-near") {
      config.pipeline.threshold_near = ParseDouble(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--threshold-sentence") {
      config.pipeline.threshold_sentence = ParseDouble(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--complementary-low") {
      config.pipeline.complementary_low = ParseDouble(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--complementary-high") {
      config.pipeline.complementary_high = ParseDouble(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--no-merge") {
      config.pipeline.merge_complementary = false;
    } else if (arg == "--no-chronology") {
      config.pipeline.preserve_chronology = false;
    } else if (arg == "--min-sentence-chars") {
      config.pipeline.min_sentence_chars = ParseUnsigned(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--levenshtein-max-chars") {
      config.pipeline.levenshtein_max_chars = ParseUnsigned(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--threads") {
      config.pipeline.num_threads = ParseUnsigned(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--timeout-ms") {
      config.pipeline.timeout_ms = ParseUnsigned(arg, NextValue(argc, argv, &i, arg));
    } else if (arg == "--entity-counter") {
      config.entity_counter = NextValue(argc, argv, &i, arg);
    } else if (arg == "--log-level") {
      config.log_level = NextValue(argc, argv, &i, arg);
    } else if (arg == "-") {
      config.input_path = arg;
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      config.input_path = arg;
    }
  }

  return config;
}

void Config::Validate() const {
  if (input_path.empty()) {
    throw std::runtime_error("an input file is required (path or - for stdin)");
  }

  if (entity_counter != "keyword" && entity_counter != "none") {
    throw std::runtime_error("Invalid entity_counter: " + entity_counter +
                             " (must be keyword or none)");
  }

  // Validate log level
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }

  rocksdb::Status st = pipeline.Validate();
  if (!st.ok()) {
    throw std::runtime_error("Invalid pipeline options: " + st.ToString());
  }
}

}  // namespace condense::cli
