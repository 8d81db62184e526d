#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <utility>

namespace strata {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

}  // namespace

phase_trace_scope::phase_trace_scope(std::string package_label,
                                     std::string level_id,
                                     std::string phase_name,
                                     std::chrono::steady_clock::time_point start_time)
    : package{ std::move(package_label) },
      level{ std::move(level_id) },
      phase{ std::move(phase_name) },
      start{ start_time } {
  STRATA_TRACE_PHASE_START(package, level, phase);
}

phase_trace_scope::~phase_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  STRATA_TRACE_PHASE_COMPLETE(package,
                              level,
                              phase,
                              static_cast<std::int64_t>(duration_ms),
                              ok);
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(phase_start),
                        TRACE_NAME(phase_complete),
                        TRACE_NAME(level_loaded),
                        TRACE_NAME(level_resolved),
                        TRACE_NAME(probe_check),
                        TRACE_NAME(command_start),
                        TRACE_NAME(command_complete),
                        TRACE_NAME(step_failed),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::phase_start const &value) {
            std::ostringstream oss;
            oss << "phase_start package=" << value.package << " level=" << value.level
                << " phase=" << value.phase;
            return oss.str();
          },
          [](trace_events::phase_complete const &value) {
            std::ostringstream oss;
            oss << "phase_complete package=" << value.package << " level=" << value.level
                << " phase=" << value.phase << " duration_ms=" << value.duration_ms
                << " ok=" << bool_string(value.ok);
            return oss.str();
          },
          [](trace_events::level_loaded const &value) {
            std::ostringstream oss;
            oss << "level_loaded level=" << value.level << " predecessor="
                << (value.predecessor.empty() ? "none" : value.predecessor)
                << " origin=" << value.origin;
            return oss.str();
          },
          [](trace_events::level_resolved const &value) {
            std::ostringstream oss;
            oss << "level_resolved level=" << value.level
                << " chain_length=" << value.chain_length
                << " phase_count=" << value.phase_count;
            return oss.str();
          },
          [](trace_events::probe_check const &value) {
            std::ostringstream oss;
            oss << "probe_check package=" << value.package << " path=" << value.path
                << " probe=" << value.probe << " result=" << bool_string(value.result);
            return oss.str();
          },
          [](trace_events::command_start const &value) {
            std::ostringstream oss;
            oss << "command_start package=" << value.package
                << " command=" << value.command << " cwd=" << value.cwd;
            return oss.str();
          },
          [](trace_events::command_complete const &value) {
            std::ostringstream oss;
            oss << "command_complete package=" << value.package
                << " command=" << value.command << " exit_code=" << value.exit_code
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::step_failed const &value) {
            std::ostringstream oss;
            oss << "step_failed package=" << value.package << " phase=" << value.phase
                << " step=" << value.step << " exit_code=" << value.exit_code;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::phase_start const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "level", value.level);
            append_kv(output, "phase", value.phase);
          },
          [&](trace_events::phase_complete const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "level", value.level);
            append_kv(output, "phase", value.phase);
            append_kv(output, "duration_ms", value.duration_ms);
            append_kv(output, "ok", value.ok);
          },
          [&](trace_events::level_loaded const &value) {
            append_kv(output, "level", value.level);
            append_kv(output, "predecessor", value.predecessor);
            append_kv(output, "origin", value.origin);
          },
          [&](trace_events::level_resolved const &value) {
            append_kv(output, "level", value.level);
            append_kv(output, "chain_length", value.chain_length);
            append_kv(output, "phase_count", value.phase_count);
          },
          [&](trace_events::probe_check const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "path", value.path);
            append_kv(output, "probe", value.probe);
            append_kv(output, "result", value.result);
          },
          [&](trace_events::command_start const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "command", value.command);
            append_kv(output, "cwd", value.cwd);
          },
          [&](trace_events::command_complete const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "command", value.command);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::step_failed const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "phase", value.phase);
            append_kv(output, "step", value.step);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace strata
