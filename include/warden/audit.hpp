#pragma once

// warden/audit.hpp - Append-only provenance log, one line per execution.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence.
//   3. CHAINED: each entry carries `prev`, the BLAKE3 "audit:" digest of the
//      previous line written by this process (64 zeros for the first one).
//   4. FAIL-SAFE: a write failure never changes the execution outcome; it
//      increments failure_count instead.
//   5. PROVENANCE: every entry records the warden and runtime versions, and
//      the policy table version in force.
//
// EXTENSION_POINT: cross_process_chain
//   Current: the chain restarts at zeros in each process.
//   Upgrade path: read the last line under an flock() at open and continue
//   from its digest.

#include <cstdint>
#include <memory>
#include <string>

namespace warden {

struct ProvenanceRecord {
  uint64_t    sequence{0};
  std::string previous_digest;
  std::string mode;
  std::string status;
  std::string error_code;
  std::string capability;
  std::string resource_kind;
  std::string source_digest;
  int         exit_code{0};
  uint64_t    duration_ns{0};
  uint64_t    timestamp_unix_ms{0};
  std::string warden_semver;
  std::string runtime_version;
  uint32_t    policy_table_version{0};
  uint32_t    hash_algorithm_version{0};
  uint32_t    audit_log_version{0};
};

std::string provenance_to_json(const ProvenanceRecord& r);

class ImmutableAuditLog {
 public:
  // Empty path: appends are accepted and discarded.
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, prev, timestamp and version fields in place.
  // Never throws. If it returns false the entry was not written.
  bool append(ProvenanceRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// Activated by set_audit_log_path() or WARDEN_AUDIT_LOG before first use.
ImmutableAuditLog& global_audit_log();
void set_audit_log_path(const std::string& path);

}  // namespace warden
