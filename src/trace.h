#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace strata {

namespace trace_events {

struct phase_start {
  std::string package;
  std::string level;
  std::string phase;
};

struct phase_complete {
  std::string package;
  std::string level;
  std::string phase;
  std::int64_t duration_ms;
  bool ok;
};

struct level_loaded {
  std::string level;
  std::string predecessor;  // empty for the base level
  std::string origin;
};

struct level_resolved {
  std::string level;
  std::int64_t chain_length;
  std::int64_t phase_count;
};

struct probe_check {
  std::string package;
  std::string path;
  std::string probe;  // "exists", "regular" or "executable"
  bool result;
};

struct command_start {
  std::string package;
  std::string command;
  std::string cwd;
};

struct command_complete {
  std::string package;
  std::string command;
  int exit_code;
  std::int64_t duration_ms;
};

struct step_failed {
  std::string package;
  std::string phase;
  std::string step;
  int exit_code;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::phase_start,
                                   trace_events::phase_complete,
                                   trace_events::level_loaded,
                                   trace_events::level_resolved,
                                   trace_events::probe_check,
                                   trace_events::command_start,
                                   trace_events::command_complete,
                                   trace_events::step_failed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits phase_start on construction and phase_complete on destruction. Call
// mark_ok() once the phase body returned normally.
struct phase_trace_scope {
  std::string package;
  std::string level;
  std::string phase;
  std::chrono::steady_clock::time_point start;
  bool ok{ false };

  phase_trace_scope(std::string package_label,
                    std::string level_id,
                    std::string phase_name,
                    std::chrono::steady_clock::time_point start_time);
  ~phase_trace_scope();

  void mark_ok() { ok = true; }
};

}  // namespace strata

#define STRATA_TRACE_UNLIKELY [[unlikely]]

#define STRATA_TRACE_EMIT(event_expr) \
  do { \
    if (::strata::tui::g_trace_enabled) STRATA_TRACE_UNLIKELY { \
        ::strata::tui::trace event_expr; \
      } \
  } while (0)

#define STRATA_TRACE_PHASE_START(package_value, level_value, phase_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::phase_start{ \
      .package = (package_value), \
      .level = (level_value), \
      .phase = (phase_value), \
  }))

#define STRATA_TRACE_PHASE_COMPLETE(package_value, \
                                    level_value, \
                                    phase_value, \
                                    duration_value, \
                                    ok_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::phase_complete{ \
      .package = (package_value), \
      .level = (level_value), \
      .phase = (phase_value), \
      .duration_ms = (duration_value), \
      .ok = (ok_value), \
  }))

#define STRATA_TRACE_LEVEL_LOADED(level_value, predecessor_value, origin_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::level_loaded{ \
      .level = (level_value), \
      .predecessor = (predecessor_value), \
      .origin = (origin_value), \
  }))

#define STRATA_TRACE_LEVEL_RESOLVED(level_value, chain_length_value, phase_count_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::level_resolved{ \
      .level = (level_value), \
      .chain_length = (chain_length_value), \
      .phase_count = (phase_count_value), \
  }))

#define STRATA_TRACE_PROBE_CHECK(package_value, path_value, probe_value, result_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::probe_check{ \
      .package = (package_value), \
      .path = (path_value), \
      .probe = (probe_value), \
      .result = (result_value), \
  }))

#define STRATA_TRACE_COMMAND_START(package_value, command_value, cwd_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::command_start{ \
      .package = (package_value), \
      .command = (command_value), \
      .cwd = (cwd_value), \
  }))

#define STRATA_TRACE_COMMAND_COMPLETE(package_value, \
                                      command_value, \
                                      exit_code_value, \
                                      duration_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::command_complete{ \
      .package = (package_value), \
      .command = (command_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))

#define STRATA_TRACE_STEP_FAILED(package_value, phase_value, step_value, exit_code_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::step_failed{ \
      .package = (package_value), \
      .phase = (phase_value), \
      .step = (step_value), \
      .exit_code = (exit_code_value), \
  }))
