#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata {

using process_env_t = std::unordered_map<std::string, std::string>;

// Exit status reported when the child could not chdir or exec.
constexpr int kProcessSpawnFailedExit{ 127 };

struct process_result {
  int exit_code;
  std::optional<int> signal;
};

enum class process_stream { std_out, std_err };

struct process_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  process_env_t env;
};

process_env_t process_getenv();

// Run argv[0] (an absolute or relative path, not searched on PATH) with the remaining
// elements as arguments. Blocks until the child exits; output is delivered line by
// line. stdin is /dev/null.
process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg);

}  // namespace strata
