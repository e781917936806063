/**
 * Options and enum bindings for condense Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace condense::python {

/**
 * Bind Options, SimilarityWeights and SourceRole to the Python module.
 */
void BindOptions(pybind11::module_& m);

}  // namespace condense::python
