#include <iostream>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/config.hpp"
#include "warden/driver.hpp"
#include "warden/observability.hpp"

// warden is a drop-in for the interpreter binary: argv has interpreter
// semantics, so there are no warden subcommands. Configuration comes only
// from WARDEN_* variables.
int main(int argc, char** argv) {
  warden::init_config();
  const warden::WardenConfig& config = warden::global_config();
  if (!config.ok()) {
    for (const auto& err : config.errors) {
      std::cerr << "warden: invalid configuration: " << err << "\n";
    }
    return 1;
  }

  if (!config.event_log.empty()) warden::set_event_log_path(config.event_log);
  if (!config.audit_log.empty()) warden::set_audit_log_path(config.audit_log);

  std::vector<std::string> args(argv + 1, argv + argc);
  const warden::ExecutionRequest request = warden::resolve_request(args);

  warden::Driver driver(config);
  const warden::ExecutionOutcome outcome = driver.run(request);
  return outcome.exit_code;
}
