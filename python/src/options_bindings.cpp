/**
 * Options and enum bindings for condense Python bindings.
 */

#include "options_bindings.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <condense/note.hpp>
#include <condense/pipeline.hpp>
#include <condense/similarity.hpp>

#include <string>

namespace py = pybind11;

namespace condense::python {

void BindOptions(py::module_& m) {
  // SourceRole enum
  py::enum_<SourceRole>(m, "SourceRole", "Author of a note")
      .value("ATTENDING", SourceRole::kAttending)
      .value("RESIDENT", SourceRole::kResident)
      .value("CONSULTANT", SourceRole::kConsultant)
      .value("PT_OT", SourceRole::kPtOt, "Physical or occupational therapy")
      .value("OPERATIVE", SourceRole::kOperative, "Operative or procedure note")
      .value("UNKNOWN", SourceRole::kUnknown);

  m.def("parse_source_role", &ParseSourceRole, py::arg("label"),
        "Resolve a free-form role label to a SourceRole");

  // SimilarityWeights
  py::class_<SimilarityWeights>(m, "SimilarityWeights",
                                "Component weights of the combined score")
      .def(py::init<>())
      .def(py::init([](double j, double l, double s) {
             SimilarityWeights w;
             w.jaccard = j;
             w.levenshtein = l;
             w.semantic = s;
             return w;
           }),
           py::arg("jaccard"), py::arg("levenshtein"), py::arg("semantic"))
      .def_readwrite("jaccard", &SimilarityWeights::jaccard,
                     "Token-set overlap weight (default: 0.4)")
      .def_readwrite("levenshtein", &SimilarityWeights::levenshtein,
                     "Edit-distance weight (default: 0.2)")
      .def_readwrite("semantic", &SimilarityWeights::semantic,
                     "Concept overlap weight (default: 0.4)")
      .def("__repr__", [](const SimilarityWeights& w) {
        return "<condense.SimilarityWeights jaccard=" + std::to_string(w.jaccard) +
               " levenshtein=" + std::to_string(w.levenshtein) +
               " semantic=" + std::to_string(w.semantic) + ">";
      });

  // Options class
  py::class_<Options>(m, "Options", "Pipeline configuration options")
      .def(py::init<>())

      // Scoring
      .def_readwrite("weights", &Options::weights,
                     "Similarity weights, must sum to 1.0")
      .def_readwrite("threshold_near", &Options::threshold_near,
                     "Near-duplicate threshold (default: 0.85)")
      .def_readwrite("threshold_sentence", &Options::threshold_sentence,
                     "Sentence duplicate threshold (default: 0.85)")
      .def_readwrite("complementary_low", &Options::complementary_low,
                     "Merge band lower bound, inclusive (default: 0.30)")
      .def_readwrite("complementary_high", &Options::complementary_high,
                     "Merge band upper bound, exclusive (default: 0.60)")

      // Behavior
      .def_readwrite("preserve_chronology", &Options::preserve_chronology,
                     "Order output by earliest folded-in note (default: True)")
      .def_readwrite("merge_complementary", &Options::merge_complementary,
                     "Run the complementary merge phase (default: True)")
      .def_readwrite("min_sentence_chars", &Options::min_sentence_chars,
                     "Fuzzy sentence comparison floor (default: 10)")
      .def_readwrite("levenshtein_max_chars", &Options::levenshtein_max_chars,
                     "Edit distance prefix bound, 0=unbounded (default: 0)")

      // Execution
      .def_readwrite("num_threads", &Options::num_threads,
                     "Comparison worker threads (default: 1)")
      .def_readwrite("timeout_ms", &Options::timeout_ms,
                     "Run deadline in milliseconds, 0=none (default: 0)")

      .def("__repr__", [](const Options& o) {
        std::string repr = "<condense.Options";
        repr += " threshold_near=" + std::to_string(o.threshold_near);
        repr += " num_threads=" + std::to_string(o.num_threads);
        repr += " timeout_ms=" + std::to_string(o.timeout_ms);
        repr += ">";
        return repr;
      });
}

}  // namespace condense::python
