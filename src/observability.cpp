#include "warden/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "warden/jsonlite.hpp"
#include "warden/version.hpp"

namespace warden {

namespace {

std::mutex g_sink_mu;
std::string g_sink_path;
bool g_sink_set = false;
std::atomic<EventHook> g_event_hook{nullptr};

std::string sink_path() {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_sink_set) return g_sink_path;
  const char* env = std::getenv("WARDEN_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}

void write_line(const std::string& json) {
  if (EventHook hook = g_event_hook.load(std::memory_order_acquire)) hook(json);

  const std::string path = sink_path();
  if (path.empty()) return;

  const std::string line = json + "\n";
  std::lock_guard<std::mutex> lk(g_sink_mu);
  // O_APPEND writes below PIPE_BUF do not interleave across processes.
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) {
    global_sandbox_stats().sink_failures.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
    global_sandbox_stats().sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
  std::fclose(f);
}

}  // namespace

std::string execution_event_to_json(const ExecutionEvent& ev) {
  std::ostringstream o;
  o << "{\"event\":\"execution\""
    << ",\"v\":" << version::EVENT_LOG_VERSION
    << ",\"mode\":\"" << ev.mode << "\""
    << ",\"status\":\"" << ev.status << "\""
    << ",\"error_code\":\"" << ev.error_code << "\""
    << ",\"capability\":\"" << jsonlite::escape(ev.capability) << "\""
    << ",\"resource_kind\":\"" << ev.resource_kind << "\""
    << ",\"exit_code\":" << ev.exit_code
    << ",\"duration_ns\":" << ev.duration_ns
    << ",\"source_digest\":\"" << ev.source_digest << "\""
    << ",\"bytes_source\":" << ev.bytes_source
    << ",\"bytes_stdout\":" << ev.bytes_stdout
    << ",\"bytes_stderr\":" << ev.bytes_stderr
    << ",\"license_present\":" << (ev.license_present ? "true" : "false")
    << "}";
  return o.str();
}

std::string denial_event_to_json(const DenialEvent& ev) {
  std::ostringstream o;
  o << "{\"event\":\"denial\""
    << ",\"v\":" << version::EVENT_LOG_VERSION
    << ",\"capability\":\"" << jsonlite::escape(ev.capability) << "\""
    << ",\"kind\":\"" << ev.kind << "\""
    << ",\"tier\":\"" << ev.tier << "\""
    << "}";
  return o.str();
}

void SandboxStats::record_execution(const ExecutionEvent& ev) {
  total_executions.fetch_add(1, std::memory_order_relaxed);
  if (ev.status == "completed") completed.fetch_add(1, std::memory_order_relaxed);
  else if (ev.status == "capability_denied") capability_denied.fetch_add(1, std::memory_order_relaxed);
  else if (ev.status == "resource_exceeded") resource_exceeded.fetch_add(1, std::memory_order_relaxed);
  else if (ev.status == "timeout") timeouts.fetch_add(1, std::memory_order_relaxed);
  else runtime_errors.fetch_add(1, std::memory_order_relaxed);
}

std::string SandboxStats::to_json() const {
  auto v = [](const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); };
  std::ostringstream o;
  o << "{"
    << "\"total_executions\":" << v(total_executions)
    << ",\"completed\":" << v(completed)
    << ",\"capability_denied\":" << v(capability_denied)
    << ",\"resource_exceeded\":" << v(resource_exceeded)
    << ",\"timeouts\":" << v(timeouts)
    << ",\"runtime_errors\":" << v(runtime_errors)
    << ",\"denials_raised\":" << v(denials_raised)
    << ",\"governor_installs\":" << v(governor_installs)
    << ",\"governor_rejections\":" << v(governor_rejections)
    << ",\"sink_failures\":" << v(sink_failures)
    << "}";
  return o.str();
}

SandboxStats& global_sandbox_stats() {
  static SandboxStats inst;
  return inst;
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink_path = path;
  g_sink_set = true;
}

void set_event_hook(EventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_sandbox_stats().record_execution(ev);
  write_line(execution_event_to_json(ev));
}

void emit_denial_event(const DenialEvent& ev) {
  global_sandbox_stats().denials_raised.fetch_add(1, std::memory_order_relaxed);
  write_line(denial_event_to_json(ev));
}

}  // namespace warden
