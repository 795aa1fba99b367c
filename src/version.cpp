#include "warden/version.hpp"

#include <Python.h>

#include <sstream>

#include "warden/jsonlite.hpp"

namespace warden {
namespace version {

std::string runtime_version() {
  // Py_GetVersion() is safe before Py_Initialize: "3.11.9 (main, ...) [GCC ...]".
  const std::string full = Py_GetVersion();
  const auto end = full.find_first_of(" \t");
  return end == std::string::npos ? full : full.substr(0, end);
}

VersionManifest current_manifest() {
  VersionManifest m;
  m.runtime_version = runtime_version();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"warden_semver\":\"" << jsonlite::escape(m.warden_semver) << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"policy_table\":" << m.policy_table
    << ",\"event_log\":" << m.event_log
    << ",\"audit_log\":" << m.audit_log
    << ",\"runtime_version\":\"" << jsonlite::escape(m.runtime_version) << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace warden
