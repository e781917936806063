/**
 * Pipeline class bindings for condense Python bindings.
 */

#include "pipeline_bindings.hpp"
#include "exceptions.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <condense/entity_counter.hpp>
#include <condense/normalize.hpp>
#include <condense/pipeline.hpp>

#include <memory>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace pybind11::literals;

namespace condense::python {

namespace {

// Accepts str, or a dict with "text" and optional "source_role"/"sourceRole"/
// "role", "sequence_index"/"sequenceIndex" and "id".
NoteInput ToNoteInput(const py::handle& item) {
  NoteInput in;
  if (py::isinstance<py::str>(item)) {
    in.text = item.cast<std::string>();
    return in;
  }
  if (!py::isinstance<py::dict>(item)) {
    throw py::type_error("notes must be str or dict");
  }
  auto d = py::reinterpret_borrow<py::dict>(item);

  auto lookup = [&d](std::initializer_list<const char*> keys) -> py::object {
    for (const char* k : keys) {
      if (d.contains(k) && !d[k].is_none()) return d[k];
    }
    return py::none();
  };

  // Non-string text leaves the input without text; the pipeline skips it.
  py::object text = lookup({"text"});
  if (py::isinstance<py::str>(text)) in.text = text.cast<std::string>();

  py::object role = lookup({"source_role", "sourceRole", "role"});
  if (py::isinstance<py::str>(role)) in.role = role.cast<std::string>();

  py::object seq = lookup({"sequence_index", "sequenceIndex"});
  if (py::isinstance<py::int_>(seq)) in.sequence_index = seq.cast<int64_t>();

  py::object id = lookup({"id"});
  if (py::isinstance<py::str>(id)) {
    in.id = id.cast<std::string>();
  } else if (py::isinstance<py::int_>(id)) {
    in.id = std::to_string(id.cast<int64_t>());
  }
  return in;
}

py::dict ToDict(const DeduplicationResult& r) {
  py::list notes;
  for (const auto& n : r.notes) {
    notes.append(py::dict(
        "id"_a = n.id, "text"_a = n.text,
        "source_role"_a = std::string(SourceRoleName(n.source_role)),
        "sequence_index"_a = n.sequence_index,
        "earliest_sequence_index"_a = n.earliest_sequence_index,
        "provenance"_a = n.provenance, "merged"_a = n.merged,
        "modified"_a = n.modified));
  }

  py::list clusters;
  for (const auto& c : r.clusters) {
    clusters.append(py::dict("representative_note_id"_a = c.representative_note_id,
                             "member_note_ids"_a = c.member_note_ids));
  }

  const auto& ps = r.phase_stats;
  py::list errors;
  for (const auto& e : ps.errors) {
    errors.append(py::dict("phase"_a = e.phase, "message"_a = e.message));
  }
  py::dict stats(
      "exact_removed"_a = ps.exact_removed, "near_removed"_a = ps.near_removed,
      "sentences_removed"_a = ps.sentences_removed,
      "notes_emptied"_a = ps.notes_emptied, "merged"_a = ps.merged,
      "skipped_inputs"_a = ps.skipped_inputs,
      "phases_completed"_a = ps.phases_completed,
      "durations_us"_a = py::dict("exact"_a = ps.exact_us, "near"_a = ps.near_us,
                                  "sentence"_a = ps.sentence_us,
                                  "merge"_a = ps.merge_us),
      "errors"_a = errors);

  return py::dict("notes"_a = notes, "input_count"_a = r.input_count,
                  "output_count"_a = r.output_count,
                  "reduction_percent"_a = r.reduction_percent,
                  "cluster_count"_a = r.cluster_count, "clusters"_a = clusters,
                  "phase_stats"_a = stats, "partial"_a = r.partial);
}

py::dict ScoreDict(const SimilarityScore& s) {
  return py::dict("jaccard"_a = s.jaccard, "levenshtein"_a = s.levenshtein,
                  "semantic"_a = s.semantic, "combined"_a = s.combined);
}

}  // namespace

/**
 * Wrapper class for Pipeline that provides Python-friendly API.
 *
 * Uses shared_ptr for Python ownership while wrapping unique_ptr internally.
 */
class PyPipeline {
 public:
  static std::shared_ptr<PyPipeline> Create(const Options& options,
                                            const std::string& entity_counter) {
    Options opt = options;
    if (entity_counter == "keyword") {
      opt.entity_counter = std::make_shared<KeywordEntityCounter>();
    } else if (entity_counter != "none") {
      throw py::value_error("entity_counter must be 'keyword' or 'none'");
    }

    auto wrapper = std::make_shared<PyPipeline>();
    CheckStatus(Pipeline::Create(&wrapper->pipeline_, opt));
    return wrapper;
  }

  py::dict Run(const py::iterable& notes) {
    std::vector<NoteInput> inputs;
    for (const auto& item : notes) {
      inputs.push_back(ToNoteInput(item));
    }

    DeduplicationResult result;
    rocksdb::Status status;
    {
      py::gil_scoped_release release;  // Release GIL for the comparison work
      status = pipeline_->Run(inputs, &result);
    }
    CheckStatus(status);
    return ToDict(result);
  }

  py::dict Similarity(const std::string& a, const std::string& b) {
    SimilarityScore score;
    {
      py::gil_scoped_release release;
      score = pipeline_->Similarity(a, b);
    }
    return ScoreDict(score);
  }

  const Options& options() const { return pipeline_->options(); }

 private:
  std::unique_ptr<Pipeline> pipeline_;
};

void BindPipeline(py::module_& m) {
  py::class_<PyPipeline, std::shared_ptr<PyPipeline>>(
      m, "Pipeline",
      R"doc(Clinical note deduplication pipeline.

A pipeline is immutable once created and may be shared between threads.

Example:
    >>> p = condense.Pipeline.create()
    >>> r = p.run(["Pt developed vasospasm POD#3.",
    ...            {"text": "Patient developed vasospasm on POD 3.",
    ...             "source_role": "attending"}])
    >>> r["output_count"]
    1
    )doc")
      .def_static("create", &PyPipeline::Create,
                  py::arg("options") = Options(),
                  py::arg("entity_counter") = "keyword",
                  R"doc(Validate options and build a pipeline.

Args:
    options: Pipeline options
    entity_counter: 'keyword' or 'none'

Raises:
    InvalidArgumentError: If an option is out of range
        )doc")

      .def("run", &PyPipeline::Run, py::arg("notes"),
           R"doc(Deduplicate a list of notes.

Args:
    notes: Iterable of str or dict with keys text, source_role,
        sequence_index and id

Returns:
    Result dict with notes, clusters, phase_stats and counts
        )doc")

      .def("similarity", &PyPipeline::Similarity, py::arg("a"), py::arg("b"),
           "Score two texts with this pipeline's weights")

      .def_property_readonly("options", &PyPipeline::options,
                             "Options the pipeline was created with");

  m.def(
      "similarity",
      [](const std::string& a, const std::string& b, const SimilarityWeights& w) {
        CheckStatus(w.Validate());
        SimilarityScore score;
        {
          py::gil_scoped_release release;
          SimilarityScorer scorer(w);
          score = scorer.Score(NormalizeNote(a), NormalizeNote(b));
        }
        return ScoreDict(score);
      },
      py::arg("a"), py::arg("b"), py::arg("weights") = SimilarityWeights(),
      "Score two texts with the default lexicon");
}

}  // namespace condense::python
