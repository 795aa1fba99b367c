#pragma once

// warden/import_finder.hpp - sys.meta_path finder enforcing provider isolation.
//
// DESIGN:
//   sys.path is one flat list, so a module shipped by provider A that does
//   `import shared` would get whichever copy of `shared` comes first, possibly
//   the one in a conflicting provider's segment. The finder sits in front of
//   the standard finders and, for top-level imports made from a file inside a
//   provider's segment, checks where the flat lookup would land:
//
//     no conflict on the way     -> None, the standard finders load it
//     lands in a conflicting or  -> spec for resolve(name, provider), or
//     escaping segment              ModuleNotFoundError when it has none
//
//   Submodules are left to the parent package's __path__, which already
//   points into the segment the parent was resolved from.
//
// INVARIANTS:
//   - The importer is the innermost frame outside the frozen import
//     machinery. Imports issued from C or from system segments are not
//     attributed to any provider and pass through.
//   - The finder copies the namespace; later changes to the caller's copy
//     have no effect.

#include <pybind11/pybind11.h>

#include "warden/namespace.hpp"

namespace warden {

namespace py = pybind11;

// A finder object (anything with find_spec) for sys.meta_path. Needs the GIL.
py::object make_namespace_finder(const ExtensionNamespace& ns);

// Puts a finder for `ns` at the front of sys.meta_path and returns it.
py::object install_namespace_finder(const ExtensionNamespace& ns);

}  // namespace warden
