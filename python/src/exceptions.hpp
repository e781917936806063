/**
 * Exception handling for condense Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>
#include <rocksdb/status.h>

namespace condense::python {

/**
 * Register exception types with the Python module.
 */
void RegisterExceptions(pybind11::module_& m);

/**
 * Check a rocksdb::Status and throw appropriate Python exception if not OK.
 */
void CheckStatus(const rocksdb::Status& status);

}  // namespace condense::python
