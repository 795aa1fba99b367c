#include "warden/pyhost.hpp"

#include <pybind11/embed.h>

namespace warden::pyhost {

namespace {

PyObject* g_capability_denied = nullptr;
PyObject* g_execution_timeout = nullptr;
PyObject* g_resource_exceeded = nullptr;

void add_exception(py::module_& m, const char* qualified, const char* attr,
                   PyObject* base, const char* doc) {
  PyObject* type = PyErr_NewExceptionWithDoc(qualified, doc, base, nullptr);
  if (type == nullptr) throw py::error_already_set();
  m.add_object(attr, py::reinterpret_steal<py::object>(type));
}

}  // namespace

py::module_ import_unchecked(const char* name) {
  PyObject* mod = PyImport_ImportModuleLevel(name, nullptr, nullptr, nullptr, 0);
  if (mod == nullptr) throw py::error_already_set();
  return py::reinterpret_steal<py::module_>(mod);
}

void init_exception_types() {
  if (exception_types_ready()) return;
  py::module_ m = import_unchecked("_warden");
  g_capability_denied = m.attr("CapabilityDenied").inc_ref().ptr();
  g_execution_timeout = m.attr("ExecutionTimeout").inc_ref().ptr();
  g_resource_exceeded = m.attr("ResourceExceeded").inc_ref().ptr();
}

bool exception_types_ready() {
  return g_capability_denied != nullptr;
}

PyObject* capability_denied_type() { return g_capability_denied; }
PyObject* execution_timeout_type() { return g_execution_timeout; }
PyObject* resource_exceeded_type() { return g_resource_exceeded; }

void set_capability_denied(const std::string& capability, const std::string& message) {
  py::str msg(message);
  py::str name(capability);
  // Always returns NULL; the error indicator is what matters.
  PyErr_SetImportErrorSubclass(g_capability_denied, msg.ptr(), name.ptr(), nullptr);
}

void set_execution_timeout(const std::string& message) {
  PyErr_SetString(g_execution_timeout, message.c_str());
}

void set_resource_exceeded(ResourceKind kind, const std::string& message) {
  const std::string kind_name = to_string(kind);
  PyObject* inst = PyObject_CallFunction(g_resource_exceeded, "ss", message.c_str(),
                                         kind_name.c_str());
  if (inst == nullptr) return;  // constructor failure is already the pending error
  py::str kind_obj(kind_name);
  if (PyObject_SetAttrString(inst, "kind", kind_obj.ptr()) != 0) {
    Py_DECREF(inst);
    return;
  }
  PyErr_SetObject(g_resource_exceeded, inst);
  Py_DECREF(inst);
}

void raise_capability_denied(const std::string& capability, const std::string& message) {
  set_capability_denied(capability, message);
  throw py::error_already_set();
}

py::object alarm_handler() {
  return import_unchecked("_warden").attr("_on_deadline");
}

py::object cpu_limit_handler() {
  return import_unchecked("_warden").attr("_on_cpu_limit");
}

}  // namespace warden::pyhost

PYBIND11_EMBEDDED_MODULE(_warden, m) {
  namespace py = pybind11;
  m.doc() = "warden sandbox internals";

  warden::pyhost::add_exception(m, "_warden.CapabilityDenied", "CapabilityDenied",
                                PyExc_ImportError,
                                "A denied capability was requested.");
  warden::pyhost::add_exception(m, "_warden.ExecutionTimeout", "ExecutionTimeout",
                                PyExc_BaseException,
                                "The wall-clock deadline elapsed.");
  warden::pyhost::add_exception(m, "_warden.ResourceExceeded", "ResourceExceeded",
                                PyExc_BaseException,
                                "A resource ceiling was reached. args: (message, kind).");

  // Signal handlers run on the main thread between bytecodes.
  m.def("_on_deadline", [](py::object, py::object) {
    warden::pyhost::set_execution_timeout("Code execution timeout");
    throw py::error_already_set();
  });
  m.def("_on_cpu_limit", [](py::object, py::object) {
    warden::pyhost::set_resource_exceeded(warden::ResourceKind::cpu,
                                          "CPU time limit exceeded");
    throw py::error_already_set();
  });
}
