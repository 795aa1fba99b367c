#include "warden/import_finder.hpp"

#include <frameobject.h>

#include <memory>
#include <string>

#include "warden/pyhost.hpp"

namespace warden {

namespace {

bool in_import_machinery(const std::string& filename) {
  return filename.rfind("<frozen ", 0) == 0;
}

// co_filename of the frame that issued the import, "" when there is none.
std::string importer_file() {
  PyFrameObject* current = PyEval_GetFrame();  // borrowed
  if (current == nullptr) return {};
  py::object frame = py::reinterpret_borrow<py::object>(reinterpret_cast<PyObject*>(current));
  while (!frame.is_none()) {
    const std::string filename = py::str(frame.attr("f_code").attr("co_filename"));
    if (!in_import_machinery(filename)) return filename;
    frame = frame.attr("f_back");
  }
  return {};
}

[[noreturn]] void raise_not_found(const std::string& module, const std::string& requester) {
  py::str msg("No module named '" + module + "' visible to provider '" + requester + "'");
  py::str name(module);
  PyErr_SetImportErrorSubclass(PyExc_ModuleNotFoundError, msg.ptr(), name.ptr(), nullptr);
  throw py::error_already_set();
}

py::object find_spec(const ExtensionNamespace& ns, const py::object& spec_from_file,
                     const std::string& fullname) {
  if (fullname.find('.') != std::string::npos) return py::none();

  const std::string requester = ns.provider_of(importer_file());
  if (requester.empty() || !ns.has_conflicts(requester)) return py::none();

  const Resolution first = ns.resolve(fullname);
  if (!first.found) return py::none();
  if (first.contained && !ns.conflicts(first.provider, requester)) return py::none();

  const Resolution own = ns.resolve(fullname, requester);
  if (!own.found) raise_not_found(fullname, requester);
  if (own.package_dir.empty()) return spec_from_file(fullname, own.path);
  py::list locations;
  locations.append(own.package_dir);
  return spec_from_file(fullname, own.path, py::arg("submodule_search_locations") = locations);
}

}  // namespace

py::object make_namespace_finder(const ExtensionNamespace& ns) {
  auto shared = std::make_shared<const ExtensionNamespace>(ns);
  // import_unchecked returns the top-level package for a dotted name.
  py::object spec_from_file =
      pyhost::import_unchecked("importlib.util").attr("util").attr("spec_from_file_location");

  py::object finder = pyhost::import_unchecked("types").attr("SimpleNamespace")();
  finder.attr("find_spec") = py::cpp_function(
      [shared, spec_from_file](const std::string& fullname, py::object /*path*/,
                               py::object /*target*/) {
        return find_spec(*shared, spec_from_file, fullname);
      },
      py::name("find_spec"), py::arg("fullname"), py::arg("path") = py::none(),
      py::arg("target") = py::none());
  return finder;
}

py::object install_namespace_finder(const ExtensionNamespace& ns) {
  py::object finder = make_namespace_finder(ns);
  pyhost::import_unchecked("sys").attr("meta_path").attr("insert")(0, finder);
  return finder;
}

}  // namespace warden
