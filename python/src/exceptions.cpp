/**
 * Exception handling for condense Python bindings.
 *
 * Maps rocksdb::Status to Python exceptions.
 */

#include "exceptions.hpp"

#include <pybind11/pybind11.h>
#include <rocksdb/status.h>

#include <string>

namespace py = pybind11;

namespace condense::python {

static PyObject* CondenseError = nullptr;
static PyObject* InvalidArgumentError = nullptr;
static PyObject* TimedOutError = nullptr;

void RegisterExceptions(py::module_& m) {
  CondenseError =
      PyErr_NewException("condense.CondenseError", PyExc_Exception, nullptr);
  py::setattr(m, "CondenseError", py::handle(CondenseError));

  // Subclasses ValueError too so plain `except ValueError` catches bad options.
  py::tuple invalid_bases = py::make_tuple(py::handle(CondenseError),
                                           py::handle(PyExc_ValueError));
  InvalidArgumentError = PyErr_NewException("condense.InvalidArgumentError",
                                            invalid_bases.ptr(), nullptr);
  py::setattr(m, "InvalidArgumentError", py::handle(InvalidArgumentError));

  TimedOutError =
      PyErr_NewException("condense.TimedOutError", CondenseError, nullptr);
  py::setattr(m, "TimedOutError", py::handle(TimedOutError));
}

void CheckStatus(const rocksdb::Status& status) {
  if (status.ok()) {
    return;
  }

  const std::string msg = status.ToString();

  if (status.IsInvalidArgument()) {
    PyErr_SetString(InvalidArgumentError, msg.c_str());
    throw py::error_already_set();
  }
  if (status.IsTimedOut()) {
    PyErr_SetString(TimedOutError, msg.c_str());
    throw py::error_already_set();
  }

  PyErr_SetString(CondenseError, msg.c_str());
  throw py::error_already_set();
}

}  // namespace condense::python
