/**
 * Pipeline class bindings for condense Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace condense::python {

/**
 * Bind Pipeline and the free similarity() helper to the Python module.
 */
void BindPipeline(pybind11::module_& m);

}  // namespace condense::python
