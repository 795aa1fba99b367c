#pragma once

// warden/pyhost.hpp - Host-side helpers for the embedded interpreter.
//
// The embedded module `_warden` defines the three sandbox exception types:
//
//   CapabilityDenied(ImportError)   denial; `name` carries the capability
//   ExecutionTimeout(BaseException) wall deadline elapsed
//   ResourceExceeded(BaseException) args (message, kind); `kind` attribute
//
// The timeout and resource kinds derive from BaseException so that a bare
// `except Exception` in user code cannot absorb them.
//
// INVARIANTS:
//   - init_exception_types() runs once after interpreter start, before any
//     user code. The cached type pointers are owned references held for the
//     process lifetime.
//   - All functions here require the GIL.

#include <pybind11/pybind11.h>

#include <string>

#include "warden/types.hpp"

namespace warden::pyhost {

namespace py = pybind11;

// Imports `name` without consulting any `__import__` override in the calling
// frame's builtins. Throws py::error_already_set on failure.
py::module_ import_unchecked(const char* name);

void init_exception_types();
bool exception_types_ready();

PyObject* capability_denied_type();
PyObject* execution_timeout_type();
PyObject* resource_exceeded_type();

// Set the Python error indicator. Callers return NULL/-1 or throw
// py::error_already_set afterwards.
void set_capability_denied(const std::string& capability, const std::string& message);
void set_execution_timeout(const std::string& message);
void set_resource_exceeded(ResourceKind kind, const std::string& message);

[[noreturn]] void raise_capability_denied(const std::string& capability,
                                          const std::string& message);

// Python callables installed as signal handlers by the governor.
py::object alarm_handler();
py::object cpu_limit_handler();

}  // namespace warden::pyhost
