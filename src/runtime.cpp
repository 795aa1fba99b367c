#include "warden/runtime.hpp"

#include <pybind11/embed.h>

#include <cstdlib>
#include <filesystem>

#include "warden/import_finder.hpp"
#include "warden/pyhost.hpp"

namespace py = pybind11;

namespace warden {

namespace {

// PyConfig owns heap strings; PyConfig_Clear on every exit path.
struct ConfigGuard {
  PyConfig config;
  ConfigGuard() { PyConfig_InitIsolatedConfig(&config); }
  ~ConfigGuard() { PyConfig_Clear(&config); }
};

}  // namespace

Runtime::~Runtime() = default;

RuntimeStart start_runtime(const WardenConfig& config) {
  RuntimeStart r;
  std::unique_ptr<Runtime> rt(new Runtime());

  if (!config.license_env.empty() && std::getenv(config.license_env.c_str()) == nullptr) {
    setenv(config.license_env.c_str(), config.license_file.c_str(), 0);
  }
  std::error_code ec;
  const char* license = std::getenv(config.license_env.c_str());
  rt->license_present_ = license != nullptr && std::filesystem::exists(license, ec);

  ConfigGuard guard;
  PyConfig& pc = guard.config;
  pc.install_signal_handlers = 1;
  pc.write_bytecode = 0;
  pc.buffered_stdio = 0;
  // Prefix discovery follows the real interpreter so its site-packages count
  // as system segments.
  if (!config.runtime_binary.empty()) {
    PyStatus st = PyConfig_SetBytesString(&pc, &pc.program_name, config.runtime_binary.c_str());
    if (PyStatus_Exception(st)) {
      r.error_code = ErrorCode::runtime_init_failed;
      r.message = st.err_msg ? st.err_msg : "PyConfig program_name";
      return r;
    }
  }

  try {
    rt->interp_ = std::make_unique<py::scoped_interpreter>(&pc, 0, nullptr, false);
  } catch (const std::exception& e) {
    r.error_code = ErrorCode::runtime_init_failed;
    r.message = e.what();
    return r;
  }

  try {
    pyhost::init_exception_types();

    py::module_ sys = pyhost::import_unchecked("sys");
    for (auto entry : sys.attr("path")) {
      const std::string p = py::str(entry).cast<std::string>();
      if (p.empty()) continue;  // "" is the current directory
      rt->initial_sys_path_.push_back(p);
    }

    rt->ns_ = config.build_namespace();
    for (const auto& p : rt->initial_sys_path_) rt->ns_.add_system(p);

    py::list path;
    for (const auto& p : rt->ns_.search_path()) path.append(p);
    sys.attr("path") = path;
    sys.attr("dont_write_bytecode") = true;
    install_namespace_finder(rt->ns_);
  } catch (const py::error_already_set& e) {
    r.error_code = ErrorCode::runtime_init_failed;
    r.message = e.what();
    return r;
  }

  r.ok = true;
  r.runtime = std::move(rt);
  return r;
}

}  // namespace warden
