/**
 * Main pybind11 module definition for condense.
 */

#include <pybind11/pybind11.h>
#include <condense/version.hpp>

#include "exceptions.hpp"
#include "options_bindings.hpp"
#include "pipeline_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_condense, m) {
  m.doc() = R"doc(
condense: deduplication of clinical notes.

Removes exact and near-duplicate notes, repeated sentences, and merges
complementary notes that describe the same day of an episode.

Basic usage:
    import condense

    pipeline = condense.Pipeline.create()
    result = pipeline.run([
        {"text": "Patient developed vasospasm on POD 3.", "source_role": "attending"},
        "Pt developed vasospasm POD#3.",
    ])
    for note in result["notes"]:
        print(note["id"], note["text"])
)doc";

  // Register exceptions first
  condense::python::RegisterExceptions(m);

  // Bind options and enums
  condense::python::BindOptions(m);

  // Bind Pipeline class
  condense::python::BindPipeline(m);

  // Version info
  m.attr("__version__") = condense::Version();
}
