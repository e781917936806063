#include <condense/cli/config.hpp>
#include <condense/entity_counter.hpp>
#include <condense/json_codec.hpp>
#include <condense/pipeline.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "info") return trantor::Logger::kInfo;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kWarn;
}

rocksdb::Status ReadInput(const std::string& path, std::string* out) {
  if (path == "-") {
    out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return rocksdb::Status::OK();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return rocksdb::Status::IOError("cannot open " + path);
  std::ostringstream buf;
  buf << file.rdbuf();
  if (file.bad()) return rocksdb::Status::IOError("read failed: " + path);
  *out = buf.str();
  return rocksdb::Status::OK();
}

rocksdb::Status WriteOutput(const std::string& path, const std::string& data) {
  if (path.empty()) {
    std::cout << data << "\n";
    return rocksdb::Status::OK();
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return rocksdb::Status::IOError("cannot open " + path);
  file << data << "\n";
  if (!file.good()) return rocksdb::Status::IOError("write failed: " + path);
  return rocksdb::Status::OK();
}

}  // namespace

int main(int argc, char** argv) {
  condense::cli::Config config;
  try {
    config = condense::cli::Config::LoadFromArgs(argc, argv);
    config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    condense::cli::PrintUsage(argv[0]);
    return 2;
  }

  trantor::Logger::setLogLevel(ToLogLevel(config.log_level));

  if (config.entity_counter == "keyword") {
    config.pipeline.entity_counter = std::make_shared<condense::KeywordEntityCounter>();
  }

  std::unique_ptr<condense::Pipeline> pipeline;
  auto s = condense::Pipeline::Create(&pipeline, config.pipeline);
  if (!s.ok()) {
    std::cerr << "Create failed: " << s.ToString() << "\n";
    return 2;
  }

  std::string json;
  s = ReadInput(config.input_path, &json);
  if (!s.ok()) {
    std::cerr << "Read failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<condense::NoteInput> inputs;
  s = condense::ParseNoteInputs(json, &inputs);
  if (!s.ok()) {
    std::cerr << "Parse failed: " << s.ToString() << "\n";
    return 1;
  }

  condense::DeduplicationResult result;
  s = pipeline->Run(inputs, &result);
  if (!s.ok()) {
    std::cerr << "Run failed: " << s.ToString() << "\n";
    return 1;
  }

  LOG_INFO << "condensed " << result.input_count << " notes to " << result.output_count
           << " (" << result.reduction_percent << "% reduction)";

  s = WriteOutput(config.output_path, condense::ResultToJson(result, config.pretty));
  if (!s.ok()) {
    std::cerr << "Write failed: " << s.ToString() << "\n";
    return 1;
  }
  return 0;
}
