#include <condense/pipeline.hpp>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Collects per-phase latency and removal counts and prints them as a table.
//
// In real usage, adapt condense::MetricsSink to your metrics library.
class PhaseReport final : public condense::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    std::string phase;
    if (Split(name, "removed_total", &phase)) {
      rows_[phase].removed += delta;
    } else if (Split(name, "failure_total", &phase)) {
      rows_[phase].failures += delta;
    } else {
      other_[std::string(name)] += delta;
    }
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    std::string phase;
    if (!Split(name, "latency_us", &phase)) return;
    auto& row = rows_[phase];
    row.runs += 1;
    row.total_us += value;
    row.max_us = std::max(row.max_us, value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (name == "condense.run.reduction_percent") reductions_.push_back(value);
  }

  void Print(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    os << "\nphase      runs  removed  failures  avg_us  max_us\n";
    for (const char* phase : {"exact", "near", "sentence", "merge"}) {
      auto it = rows_.find(phase);
      if (it == rows_.end()) continue;
      const Row& r = it->second;
      os << std::left << std::setw(10) << phase << std::right
         << std::setw(5) << r.runs
         << std::setw(9) << r.removed
         << std::setw(10) << r.failures
         << std::setw(8) << (r.runs ? r.total_us / r.runs : 0)
         << std::setw(8) << r.max_us << "\n";
    }
    for (const auto& kv : other_) os << kv.first << " = " << kv.second << "\n";
    os << "reduction per run:";
    for (double d : reductions_) os << " " << std::fixed << std::setprecision(1) << d << "%";
    os << "\n";
  }

 private:
  struct Row {
    uint64_t runs = 0;
    uint64_t removed = 0;
    uint64_t failures = 0;
    uint64_t total_us = 0;
    uint64_t max_us = 0;
  };

  // "condense.phase.<phase>.<suffix>" -> phase
  static bool Split(std::string_view name, std::string_view suffix, std::string* phase) {
    constexpr std::string_view kPrefix = "condense.phase.";
    if (name.size() <= kPrefix.size() + suffix.size() + 1) return false;
    if (name.substr(0, kPrefix.size()) != kPrefix) return false;
    if (name.substr(name.size() - suffix.size()) != suffix) return false;
    *phase = std::string(name.substr(kPrefix.size(),
                                     name.size() - kPrefix.size() - suffix.size() - 1));
    return true;
  }

  mutable std::mutex mu_;
  std::map<std::string, Row> rows_;
  std::map<std::string, uint64_t> other_;
  std::vector<double> reductions_;
};

// Prints one line per run: status, counts and the phases that finished.
class RunLine final : public condense::TraceSpan {
 public:
  void SetAttribute(std::string_view key, uint64_t value) override {
    line_ += " " + std::string(key) + "=" + std::to_string(value);
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    line_ += " " + std::string(key) + "=" + std::string(value);
  }

  void AddEvent(std::string_view name) override {
    if (!events_.empty()) events_ += ",";
    events_ += std::string(name);
  }

  void End(const rocksdb::Status& status) override {
    std::cout << "[run] " << (status.ok() ? "ok" : status.ToString()) << line_ << "\n"
              << "      " << events_ << "\n";
  }

 private:
  std::string line_;
  std::string events_;
};

class RunLineTracer final : public condense::Tracer {
 public:
  std::unique_ptr<condense::TraceSpan> StartSpan(std::string_view) override {
    return std::make_unique<RunLine>();
  }
};

}  // namespace

int main() {
  auto report = std::make_shared<PhaseReport>();

  condense::Options opt;
  opt.metrics = report;
  opt.tracer = std::make_shared<RunLineTracer>();
  opt.num_threads = 2;

  std::unique_ptr<condense::Pipeline> pipeline;
  auto s = condense::Pipeline::Create(&pipeline, opt);
  if (!s.ok()) {
    std::cerr << "Create failed: " << s.ToString() << "\n";
    return 1;
  }

  // One episode per batch, each exercising a different phase.
  const std::vector<std::vector<condense::NoteInput>> episodes = {
      {condense::NoteInput("MRI brain shows left frontal glioblastoma with edema."),
       condense::NoteInput("MRI brain shows left frontal glioblastoma with edema.")},
      {condense::NoteInput("Patient developed vasospasm on POD 3.", "attending"),
       condense::NoteInput("Pt developed vasospasm POD#3."),
       condense::NoteInput("Family meeting held; discussed discharge planning.")},
      {condense::NoteInput("Neuro exam stable without new deficit. Continue nimodipine."),
       condense::NoteInput("Neuro exam stable without new deficit. Started Keppra.")},
      {condense::NoteInput("POD 3: patient afebrile, tolerating diet."),
       condense::NoteInput("POD 3: ambulating with PT, wound clean.")},
  };

  for (const auto& episode : episodes) {
    condense::DeduplicationResult result;
    s = pipeline->Run(episode, &result);
    if (!s.ok()) std::cerr << "Run failed: " << s.ToString() << "\n";
  }

  report->Print(std::cout);
  return 0;
}
