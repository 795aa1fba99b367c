#pragma once

// warden/observability.hpp - Structured execution events and in-process counters.
//
// DESIGN:
//   Two event kinds, both one JSON object per line:
//     execution  one per Driver::run(), emitted after the governor lease is gone
//     denial     one per blocked capability, including denials user code catches
//
//   Sink: the JSONL file named by set_event_log_path() or WARDEN_EVENT_LOG.
//   Without a sink, events only update SandboxStats.
//
// INVARIANTS:
//   - Events never carry stdout/stderr content or source text, only sizes
//     and the BLAKE3 source digest.
//   - Emission never throws and never fails an execution; a sink that cannot
//     be opened increments sink_failures.
//
// EXTENSION_POINT: event_hook
//   set_event_hook() receives every rendered line before it is written.
//   Embedders forward it to their own collector.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace warden {

struct ExecutionEvent {
  std::string mode;
  std::string status;
  std::string error_code;
  std::string capability;
  std::string resource_kind;
  std::string source_digest;
  int exit_code{0};
  uint64_t duration_ns{0};
  size_t bytes_source{0};
  size_t bytes_stdout{0};
  size_t bytes_stderr{0};
  bool license_present{false};
};

struct DenialEvent {
  std::string capability;
  std::string kind;  // module, builtin, member, os_operation
  std::string tier;
};

std::string execution_event_to_json(const ExecutionEvent& ev);
std::string denial_event_to_json(const DenialEvent& ev);

class SandboxStats {
 public:
  void record_execution(const ExecutionEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> total_executions{0};
  std::atomic<uint64_t> completed{0};
  std::atomic<uint64_t> capability_denied{0};
  std::atomic<uint64_t> resource_exceeded{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> runtime_errors{0};

  std::atomic<uint64_t> denials_raised{0};
  std::atomic<uint64_t> governor_installs{0};
  std::atomic<uint64_t> governor_rejections{0};
  std::atomic<uint64_t> sink_failures{0};
};

SandboxStats& global_sandbox_stats();

void set_event_log_path(const std::string& path);
void emit_execution_event(const ExecutionEvent& ev);
void emit_denial_event(const DenialEvent& ev);

using EventHook = void (*)(const std::string& json_line);
void set_event_hook(EventHook hook);

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace warden
