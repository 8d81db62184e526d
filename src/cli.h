#pragma once

#include "cmds/cmd_levels.h"
#include "cmds/cmd_phase.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_levels::cfg, cmd_phase::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace strata
