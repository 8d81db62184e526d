#include "errors.h"

#include <utility>

namespace strata {

namespace {

std::string describe_unknown_level(std::string const &level,
                                   std::string const &referenced_by) {
  if (referenced_by.empty()) { return "unknown API level '" + level + "'"; }
  return "unknown API level '" + level + "' (predecessor of level '" + referenced_by +
         "')";
}

std::string describe_cycle(std::vector<std::string> const &chain) {
  std::string msg{ "API level predecessor cycle: " };
  for (size_t i{ 0 }; i < chain.size(); ++i) {
    if (i > 0) { msg += " -> "; }
    msg += chain[i];
  }
  return msg;
}

std::string describe_step_failure(build_step step,
                                  std::string const &reason,
                                  command_result const &result) {
  std::string msg{ std::string{ build_step_name(step) } + " step failed: " + reason };
  if (result.signal) {
    msg += " (" + result.label + " terminated by signal " +
           std::to_string(*result.signal) + ")";
  } else {
    msg += " (" + result.label + " exited with code " + std::to_string(result.exit_code) +
           ")";
  }
  return msg;
}

}  // namespace

unknown_level_error::unknown_level_error(std::string level, std::string referenced_by)
    : std::runtime_error{ describe_unknown_level(level, referenced_by) },
      level_{ std::move(level) },
      referenced_by_{ std::move(referenced_by) } {}

cycle_detected_error::cycle_detected_error(std::vector<std::string> chain)
    : std::runtime_error{ describe_cycle(chain) }, chain_{ std::move(chain) } {}

unknown_phase_error::unknown_phase_error(std::string level, std::string phase)
    : std::runtime_error{ "phase '" + phase + "' is not defined by API level '" + level +
                          "'" },
      level_{ std::move(level) },
      phase_{ std::move(phase) } {}

build_abort_error::build_abort_error(std::string const &reason)
    : std::runtime_error{ reason } {}

std::string_view build_step_name(build_step step) {
  switch (step) {
    case build_step::configure: return "configure";
    case build_step::build: return "build";
  }
  return "unknown";
}

step_failed_error::step_failed_error(build_step step,
                                     std::string const &reason,
                                     command_result result)
    : build_abort_error{ describe_step_failure(step, reason, result) },
      step_{ step },
      result_{ std::move(result) } {}

}  // namespace strata
