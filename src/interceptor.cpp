#include "warden/interceptor.hpp"

#include <fcntl.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <map>
#include <string_view>

#include "warden/observability.hpp"
#include "warden/pyhost.hpp"

namespace warden {

struct Interceptor::State {
  Policy policy;
  ExtensionNamespace ns;
  std::vector<std::string> solvers;
  std::map<std::string, bool> solver_verdicts;

  bool installed{false};
  py::dict real_builtins;
  py::object original_import;
  std::map<std::string, py::object> original_builtins;
  py::object module_type;
};

namespace {

using StatePtr = std::shared_ptr<Interceptor::State>;

// ---------------------------------------------------------------------------
// Audit hook slot
// ---------------------------------------------------------------------------
// Audit hooks live for the rest of the process, so the slot is never freed.
struct AuditHookSlot {
  std::atomic<Interceptor::State*> current{nullptr};
};

AuditHookSlot* g_hook_slot = nullptr;

void record_denial(const CapabilityName& capability, DenialTier tier) {
  try {
    emit_denial_event({capability.name, to_string(capability.kind), to_string(tier)});
  } catch (const std::exception&) {
    // The denial stands even when the event cannot be rendered.
    global_sandbox_stats().sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

[[noreturn]] void deny(const CapabilityName& capability, DenialTier tier) {
  record_denial(capability, tier);
  pyhost::raise_capability_denied(capability.name, denial_message(capability));
}

// `open` audit args are (path, mode, flags). io.FileIO passes its mode
// string and the computed O_* flags; os.open passes None and the flags.
// Never leaves an exception set.
bool opens_for_write(PyObject* args) {
  if (args == nullptr || !PyTuple_Check(args) || PyTuple_GET_SIZE(args) < 3) return false;

  PyObject* mode = PyTuple_GET_ITEM(args, 1);
  if (mode != Py_None && PyUnicode_Check(mode)) {
    const char* m = PyUnicode_AsUTF8(mode);
    if (m == nullptr) {
      PyErr_Clear();
    } else if (std::strpbrk(m, "wax+") != nullptr) {
      return true;
    }
  }

  PyObject* flags = PyTuple_GET_ITEM(args, 2);
  if (!PyLong_Check(flags)) return false;
  const long f = PyLong_AsLong(flags);
  if (f == -1 && PyErr_Occurred()) {
    PyErr_Clear();
    return false;
  }
  return (f & (O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND)) != 0;
}

int audit_hook(const char* event, PyObject* args, void* user_data) {
  auto* slot = static_cast<AuditHookSlot*>(user_data);
  Interceptor::State* st = slot->current.load(std::memory_order_acquire);
  if (st == nullptr) return 0;

  std::string_view operation = event;
  if (operation == "open") {
    if (!opens_for_write(args)) return 0;
    operation = kOpenForWrite;
  }
  if (!st->policy.is_operation_denied(operation)) return 0;

  const auto capability = CapabilityName::operation(std::string(operation));
  record_denial(capability, DenialTier::function_denied);
  pyhost::set_capability_denied(capability.name, denial_message(capability));
  return -1;
}

bool ensure_audit_hook() {
  if (g_hook_slot != nullptr) return true;
  auto* slot = new AuditHookSlot();
  if (PySys_AddAuditHook(audit_hook, slot) != 0) {
    delete slot;
    return false;
  }
  g_hook_slot = slot;
  return true;
}

// ---------------------------------------------------------------------------
// Import gate
// ---------------------------------------------------------------------------

// Absolute target of a relative import, or "" when the importer's package
// cannot be determined (the captured importer then raises its own error).
std::string absolute_name(const std::string& name, const py::object& globals, int level) {
  if (level <= 0) return name;
  if (!py::isinstance<py::dict>(globals)) return {};
  py::dict g = py::reinterpret_borrow<py::dict>(globals);

  std::string package;
  py::object pkg = g.contains("__package__") ? py::object(g["__package__"]) : py::none();
  if (!pkg.is_none()) {
    package = py::str(pkg).cast<std::string>();
  } else if (g.contains("__name__")) {
    package = py::str(py::object(g["__name__"])).cast<std::string>();
    if (!g.contains("__path__")) {
      const auto dot = package.rfind('.');
      package = dot == std::string::npos ? std::string() : package.substr(0, dot);
    }
  }
  if (package.empty()) return {};

  for (int i = 1; i < level; ++i) {
    const auto dot = package.rfind('.');
    if (dot == std::string::npos) return {};
    package.resize(dot);
  }
  return name.empty() ? package : package + "." + name;
}

std::vector<std::string> fromlist_names(const py::object& fromlist) {
  std::vector<std::string> out;
  if (fromlist.is_none()) return out;
  for (auto item : fromlist) {
    if (py::isinstance<py::str>(item)) out.push_back(item.cast<std::string>());
  }
  return out;
}

void check_solver(Interceptor::State& st, const std::string& top) {
  if (std::find(st.solvers.begin(), st.solvers.end(), top) == st.solvers.end()) return;

  auto it = st.solver_verdicts.find(top);
  if (it == st.solver_verdicts.end()) {
    const Resolution r = st.ns.resolve(top, top);
    const bool allowed = r.found && r.provider == top && r.kind == SegmentKind::trusted &&
                         r.contained;
    it = st.solver_verdicts.emplace(top, allowed).first;
  }
  if (!it->second) deny(CapabilityName::module(top), DenialTier::hard_denied);
}

py::object member_stub(const StatePtr& st, const std::string& module, const std::string& member,
                       py::object original) {
  const auto capability = CapabilityName::member(module, member);
  return py::cpp_function(
      [st, capability, original](py::args args, py::kwargs kwargs) -> py::object {
        if (st->policy.is_denied(capability).denied()) {
          deny(capability, DenialTier::selectively_denied);
        }
        return original(*args, **kwargs);
      },
      py::name(member.c_str()));
}

py::object make_proxy(const StatePtr& st, const py::object& module, const std::string& name) {
  py::object proxy = st->module_type(name, py::getattr(module, "__doc__", py::none()));
  py::dict pd = proxy.attr("__dict__");
  pd.attr("update")(module.attr("__dict__"));
  for (const auto& member : st->policy.denied_members(name)) {
    pd[py::str(member)] = member_stub(st, name, member,
                                      py::getattr(module, member.c_str(), py::none()));
  }
  return proxy;
}

std::string module_name(const py::object& module) {
  py::object n = py::getattr(module, "__name__", py::none());
  return py::isinstance<py::str>(n) ? n.cast<std::string>() : std::string();
}

py::object wrap_result(const StatePtr& st, const py::object& result,
                       const std::vector<std::string>& from_items) {
  if (!py::isinstance(result, st->module_type)) return result;
  const std::string name = module_name(result);
  if (st->policy.has_selective_entries(name)) return make_proxy(st, result, name);

  // `from pkg import sub` where pkg.sub has selective entries.
  py::object proxy;
  for (const auto& item : from_items) {
    const std::string sub = name + "." + item;
    if (!st->policy.has_selective_entries(sub) || !py::hasattr(result, item.c_str())) continue;
    py::object submodule = result.attr(item.c_str());
    if (!py::isinstance(submodule, st->module_type)) continue;
    if (!proxy) proxy = make_proxy(st, result, name);
    proxy.attr(item.c_str()) = make_proxy(st, submodule, sub);
  }
  return proxy ? proxy : result;
}

py::object gate_import(const StatePtr& st, const py::object& name_obj, const py::object& globals,
                       const py::object& locals, const py::object& fromlist, int level) {
  if (!py::isinstance<py::str>(name_obj)) {
    return st->original_import(name_obj, globals, locals, fromlist, level);
  }
  const std::string name = name_obj.cast<std::string>();
  const std::string absolute = absolute_name(name, globals, level);
  const std::string checked = absolute.empty() ? name : absolute;

  if (const auto prefix = st->policy.is_import_denied(checked)) {
    deny(CapabilityName::module(*prefix), DenialTier::hard_denied);
  }
  const auto from_items = fromlist_names(fromlist);
  for (const auto& item : from_items) {
    if (item == "*") continue;
    if (const auto prefix = st->policy.is_import_denied(checked + "." + item)) {
      deny(CapabilityName::module(*prefix), DenialTier::hard_denied);
    }
  }
  if (!checked.empty()) check_solver(*st, checked.substr(0, checked.find('.')));

  py::object result = st->original_import(name_obj, globals, locals, fromlist, level);
  return wrap_result(st, result, from_items);
}

}  // namespace

std::string denial_message(const CapabilityName& capability) {
  switch (capability.kind) {
    case CapabilityKind::module:
      return "Module '" + capability.name + "' is not allowed in secure environment";
    case CapabilityKind::builtin:
    case CapabilityKind::member:
      return capability.name + "() is not allowed in secure environment";
    case CapabilityKind::os_operation:
      return "Operation '" + capability.name + "' is not allowed in secure environment";
  }
  return capability.name + " is not allowed in secure environment";
}

Interceptor::Interceptor(const Policy& policy, const ExtensionNamespace& ns,
                         std::vector<std::string> solvers)
    : state_(std::make_shared<State>()) {
  state_->policy = policy;
  state_->ns = ns;
  state_->solvers = std::move(solvers);
}

Interceptor::~Interceptor() {
  detach();
}

InterceptorInstall Interceptor::install() {
  InterceptorInstall r;
  State& st = *state_;
  if (!st.installed) {
    try {
      py::module_ builtins = pyhost::import_unchecked("builtins");
      st.real_builtins = builtins.attr("__dict__");
      st.original_import = builtins.attr("__import__");
      for (const auto& name : st.policy.denied_builtins()) {
        st.original_builtins[name] = py::getattr(builtins, name.c_str(), py::none());
      }
      st.module_type = pyhost::import_unchecked("types").attr("ModuleType");
    } catch (const py::error_already_set& e) {
      r.error_code = ErrorCode::interceptor_install_failed;
      r.message = e.what();
      return r;
    }
    if (!ensure_audit_hook()) {
      r.error_code = ErrorCode::interceptor_install_failed;
      r.message = "audit hook registration was refused";
      return r;
    }
    st.installed = true;
  }
  g_hook_slot->current.store(state_.get(), std::memory_order_release);
  r.ok = true;
  return r;
}

void Interceptor::detach() {
  if (g_hook_slot == nullptr) return;
  State* expected = state_.get();
  g_hook_slot->current.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
}

bool Interceptor::attached() const {
  return g_hook_slot != nullptr &&
         g_hook_slot->current.load(std::memory_order_acquire) == state_.get();
}

py::dict Interceptor::make_builtins() const {
  const StatePtr st = state_;
  py::dict d = py::reinterpret_steal<py::dict>(PyDict_Copy(st->real_builtins.ptr()));
  if (!d) throw py::error_already_set();

  d["__import__"] = py::cpp_function(
      [st](py::object name, py::object globals, py::object locals, py::object fromlist,
           int level) { return gate_import(st, name, globals, locals, fromlist, level); },
      py::name("__import__"), py::arg("name"), py::arg("globals") = py::none(),
      py::arg("locals") = py::none(), py::arg("fromlist") = py::tuple(), py::arg("level") = 0);

  for (const auto& name : st->policy.denied_builtins()) {
    const auto capability = CapabilityName::builtin(name);
    auto found = st->original_builtins.find(name);
    py::object original = found == st->original_builtins.end() ? py::none() : found->second;
    d[py::str(name)] = py::cpp_function(
        [st, capability, original](py::args args, py::kwargs kwargs) -> py::object {
          if (st->policy.is_denied(capability).denied()) {
            deny(capability, DenialTier::function_denied);
          }
          return original(*args, **kwargs);
        },
        py::name(name.c_str()));
  }

  d["CapabilityDenied"] = py::handle(pyhost::capability_denied_type());
  d["ExecutionTimeout"] = py::handle(pyhost::execution_timeout_type());
  d["ResourceExceeded"] = py::handle(pyhost::resource_exceeded_type());
  return d;
}

py::object Interceptor::import_module(const std::string& name, py::object globals,
                                      py::object fromlist, int level) const {
  return gate_import(state_, py::str(name), globals, py::none(), fromlist, level);
}

const Policy& Interceptor::policy() const {
  return state_->policy;
}

}  // namespace warden
