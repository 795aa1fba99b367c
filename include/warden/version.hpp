#pragma once

// warden/version.hpp - Version manifest for every persisted format.
//
// PURPOSE:
//   Event lines and audit records outlive the binary that wrote them. Each
//   record carries the constants below so readers can tell which policy
//   table and which line schema produced it.
//
// INVARIANT:
//   All constants are compile-time. Bump the matching constant before any
//   structural change to the corresponding format.

#include <cstdint>
#include <string>

namespace warden {
namespace version {

constexpr const char* WARDEN_SEMVER = "1.0.0";

// 1 = BLAKE3-256, hex encoded, "src:" / "audit:" domains.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Bump when a default policy entry is added or removed.
constexpr uint32_t POLICY_TABLE_VERSION = 1;

// 1 = {"event":"execution"|"denial", ...} JSONL.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// 1 = NDJSON provenance with seq + prev chain.
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  std::string warden_semver{WARDEN_SEMVER};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t policy_table{POLICY_TABLE_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string runtime_version;  // "3.11.9", empty before the runtime is known
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

// "X.Y.Z" of the linked Python runtime. Does not start the interpreter.
std::string runtime_version();

}  // namespace version
}  // namespace warden
