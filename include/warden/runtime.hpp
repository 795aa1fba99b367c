#pragma once

// warden/runtime.hpp - The embedded interpreter, started once per process.
//
// LIFECYCLE:
//   start_runtime() brings the interpreter up with an isolated PyConfig,
//   creates the sandbox exception types and replaces sys.path with the
//   extension namespace lookup order, with the namespace finder in front of
//   sys.meta_path. The Runtime object owns the interpreter; destroying it
//   finalizes Python. Only one Runtime may exist per process (pybind11
//   allows a single scoped_interpreter).
//
// INVARIANTS:
//   - The licensing variable is exported before the interpreter starts, and
//     only when the environment does not already set it.
//   - System segments come from the interpreter's own initial sys.path, so
//     the stdlib and site-packages stay importable after the swap.

#include <memory>
#include <string>
#include <vector>

#include "warden/config.hpp"
#include "warden/namespace.hpp"
#include "warden/types.hpp"

namespace pybind11 {
class scoped_interpreter;
}

namespace warden {

struct RuntimeStart;

// Never throws.
RuntimeStart start_runtime(const WardenConfig& config);

class Runtime {
 public:
  ~Runtime();
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  const ExtensionNamespace& extension_namespace() const { return ns_; }
  const std::vector<std::string>& initial_sys_path() const { return initial_sys_path_; }
  bool license_present() const { return license_present_; }

 private:
  friend RuntimeStart start_runtime(const WardenConfig& config);
  Runtime() = default;

  std::unique_ptr<pybind11::scoped_interpreter> interp_;
  ExtensionNamespace ns_;
  std::vector<std::string> initial_sys_path_;
  bool license_present_{false};
};

struct RuntimeStart {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string message;
  std::unique_ptr<Runtime> runtime;
};

}  // namespace warden
