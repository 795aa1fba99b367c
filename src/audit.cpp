#include "warden/audit.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/version.hpp"

namespace warden {

std::string provenance_to_json(const ProvenanceRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"mode\":\"" << r.mode << "\""
    << ",\"status\":\"" << r.status << "\""
    << ",\"error_code\":\"" << r.error_code << "\""
    << ",\"capability\":\"" << jsonlite::escape(r.capability) << "\""
    << ",\"resource_kind\":\"" << r.resource_kind << "\""
    << ",\"source_digest\":\"" << r.source_digest << "\""
    << ",\"exit_code\":" << r.exit_code
    << ",\"duration_ns\":" << r.duration_ns
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << ",\"warden_semver\":\"" << r.warden_semver << "\""
    << ",\"runtime_version\":\"" << jsonlite::escape(r.runtime_version) << "\""
    << ",\"policy_table_version\":" << r.policy_table_version
    << ",\"hash_algorithm_version\":" << r.hash_algorithm_version
    << ",\"audit_log_version\":" << r.audit_log_version
    << "}";
  return o.str();
}

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{std::string(64, '0')};
  std::string runtime_version;
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : path_(path), impl_(std::make_unique<Impl>()) {
  if (!path_.empty()) impl_->file = std::fopen(path_.c_str(), "a");
  impl_->runtime_version = version::runtime_version();
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_->file) std::fclose(impl_->file);
}

bool ImmutableAuditLog::append(ProvenanceRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (!impl_->file) {
    if (!path_.empty()) {
      ++impl_->failure_count;
      return false;
    }
    return true;  // not configured
  }

  // Guard against the position being moved externally.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = ++impl_->seq;
  record.previous_digest = impl_->last_digest;
  record.timestamp_unix_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  record.warden_semver = version::WARDEN_SEMVER;
  record.runtime_version = impl_->runtime_version;
  record.policy_table_version = version::POLICY_TABLE_VERSION;
  record.hash_algorithm_version = version::HASH_ALGORITHM_VERSION;
  record.audit_log_version = version::AUDIT_LOG_VERSION;

  std::string line;
  try {
    line = provenance_to_json(record);
  } catch (const std::exception&) {
    ++impl_->failure_count;
    return false;
  }

  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  std::fflush(impl_->file);

  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 &&
      post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }
  // Chain only on lines that actually landed.
  impl_->last_digest = hash_domain("audit:", line);
  ++impl_->entry_count;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

namespace {
std::mutex g_audit_init_mu;
std::string g_audit_path;
bool g_audit_path_set = false;
ImmutableAuditLog* g_audit_log = nullptr;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_init_mu);
  g_audit_path = path;
  g_audit_path_set = true;
}

ImmutableAuditLog& global_audit_log() {
  std::lock_guard<std::mutex> lk(g_audit_init_mu);
  if (!g_audit_log) {
    std::string path = g_audit_path;
    if (!g_audit_path_set) {
      const char* env = std::getenv("WARDEN_AUDIT_LOG");
      if (env && env[0]) path = env;
    }
    // Lives for the rest of the process; appends may happen during exit.
    g_audit_log = new ImmutableAuditLog(path);
  }
  return *g_audit_log;
}

}  // namespace warden
