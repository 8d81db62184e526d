#pragma once

#include "process.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

constexpr std::size_t kCommandCaptureBytes{ 4096 };

struct command_result {
  std::string label;  // command name as requested, e.g. "./configure" or "make"
  std::vector<std::string> argv;
  int exit_code{ 0 };
  std::optional<int> signal;
  std::string captured_output;  // stderr tail, for diagnostics

  bool ok() const { return exit_code == 0 && !signal; }
};

class command_runner : unmovable {
 public:
  virtual ~command_runner() = default;

  // Blocks until the command terminates. A non-ok result is reported, not thrown;
  // callers decide whether it is fatal.
  virtual command_result run(std::string_view name,
                             std::vector<std::string> const &args,
                             std::filesystem::path const &cwd) = 0;

 protected:
  command_runner() = default;
};

// Spawns real processes. `name` is resolved on PATH unless it contains a '/', in which
// case relative names are taken relative to `cwd`. Stdout lines are logged at info
// level; stderr lines are logged and the last kCommandCaptureBytes kept in captured_output.
class process_command_runner : public command_runner {
 public:
  explicit process_command_runner(std::string package_label = {},
                                  process_env_t env = process_getenv());

  command_result run(std::string_view name,
                     std::vector<std::string> const &args,
                     std::filesystem::path const &cwd) override;

 private:
  std::string package_label_;
  process_env_t env_;
};

}  // namespace strata
