#include "command_runner.h"

#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <cstdint>
#include <utility>

namespace strata {

namespace {

std::optional<std::filesystem::path> resolve_command(std::string_view name,
                                                     std::filesystem::path const &cwd,
                                                     process_env_t const &env) {
  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path candidate{ name };
    if (candidate.is_relative()) { candidate = cwd / candidate; }
    if (platform::file_is_executable(candidate)) { return candidate; }
    return std::nullopt;
  }

  std::optional<std::string> path_env;
  if (auto it{ env.find("PATH") }; it != env.end()) { path_env = it->second; }
  return platform::find_executable(name, path_env);
}

}  // namespace

process_command_runner::process_command_runner(std::string package_label, process_env_t env)
    : package_label_{ std::move(package_label) }, env_{ std::move(env) } {}

command_result process_command_runner::run(std::string_view name,
                                           std::vector<std::string> const &args,
                                           std::filesystem::path const &cwd) {
  command_result result{ .label = std::string{ name } };
  result.argv.reserve(args.size() + 1);
  result.argv.emplace_back(name);
  result.argv.insert(result.argv.end(), args.begin(), args.end());

  std::string const display{ util_join_argv(result.argv) };
  tui::debug("[%s] running: %s", package_label_.c_str(), display.c_str());
  STRATA_TRACE_COMMAND_START(package_label_, display, cwd.string());

  auto const start_time{ std::chrono::steady_clock::now() };

  auto const resolved{ resolve_command(name, cwd, env_) };
  if (!resolved) {
    result.exit_code = kProcessSpawnFailedExit;
    result.captured_output = std::string{ name } + ": command not found\n";
    tui::error("[%s] %s: command not found", package_label_.c_str(), result.label.c_str());
    STRATA_TRACE_COMMAND_COMPLETE(package_label_, result.label, result.exit_code, 0);
    return result;
  }

  std::vector<std::string> argv{ result.argv };
  argv[0] = resolved->string();

  util_tail_buffer stderr_capture{ kCommandCaptureBytes };
  process_run_cfg const cfg{ .on_stdout_line =
                                 [](std::string_view line) {
                                   tui::info("%.*s",
                                             static_cast<int>(line.size()),
                                             line.data());
                                 },
                             .on_stderr_line =
                                 [&](std::string_view line) {
                                   tui::warn("%.*s",
                                             static_cast<int>(line.size()),
                                             line.data());
                                   stderr_capture.append(line);
                                   stderr_capture.append("\n");
                                 },
                             .cwd = cwd,
                             .env = env_ };

  process_result const proc{ process_run(argv, cfg) };
  result.exit_code = proc.exit_code;
  result.signal = proc.signal;
  result.captured_output = stderr_capture.str();

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start_time)
                              .count() };
  STRATA_TRACE_COMMAND_COMPLETE(package_label_,
                                result.label,
                                result.exit_code,
                                static_cast<std::int64_t>(duration_ms));

  tui::debug("[%s] %s exited with code %d",
             package_label_.c_str(),
             result.label.c_str(),
             result.exit_code);
  return result;
}

}  // namespace strata
