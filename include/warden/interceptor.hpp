#pragma once

// warden/interceptor.hpp - Enforcement of the capability policy inside the interpreter.
//
// DESIGN:
//   Three enforcement points, one per denial tier:
//
//     import gate   `__import__` in the restricted builtins. Checks every
//                   dotted prefix and each fromlist submodule, runs the
//                   solver hook, then delegates to the captured importer.
//                   Modules with selectively denied members come back as a
//                   fresh proxy module whose denied members are stubs.
//     builtin stubs function_denied builtins in the restricted builtins.
//     audit hook    PEP 578 hook vetoing function_denied os_operations.
//                   An `open` event is checked as "open.write" when its mode
//                   or flags write, so library helpers (pathlib, codecs,
//                   tempfile) cannot create or change files either.
//
//   User code sees only the restricted builtins dict from make_builtins();
//   the real `builtins` module is never modified.
//
// INVARIANTS:
//   - Original callables are captured exactly once, in install(). Wrappers
//     call them only after re-checking the policy.
//   - A proxy is built per import. Mutating one proxy cannot re-expose a
//     denied member to a later import.
//   - The audit hook is registered once per process and cannot be removed.
//     It consults the currently attached interceptor; with none attached it
//     allows everything.
//   - Every denial raises CapabilityDenied and emits one denial event.

#include <pybind11/pybind11.h>

#include <memory>
#include <string>
#include <vector>

#include "warden/namespace.hpp"
#include "warden/policy.hpp"
#include "warden/types.hpp"

namespace warden {

namespace py = pybind11;

struct InterceptorInstall {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string message;
};

// Human-readable denial text naming the capability.
std::string denial_message(const CapabilityName& capability);

class Interceptor {
 public:
  // Policy and namespace are copied; the interceptor does not borrow them.
  Interceptor(const Policy& policy, const ExtensionNamespace& ns,
              std::vector<std::string> solvers = {});
  ~Interceptor();

  Interceptor(const Interceptor&) = delete;
  Interceptor& operator=(const Interceptor&) = delete;

  // Captures the originals and attaches to the process audit hook. Needs the
  // GIL. Never throws.
  InterceptorInstall install();
  void detach();
  bool attached() const;

  // New dict each call: real builtins with the gate and stubs substituted.
  py::dict make_builtins() const;

  // The gate as user code calls it.
  py::object import_module(const std::string& name, py::object globals = py::none(),
                           py::object fromlist = py::tuple(), int level = 0) const;

  const Policy& policy() const;

  struct State;

 private:
  std::shared_ptr<State> state_;
};

}  // namespace warden
