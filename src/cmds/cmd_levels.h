#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace strata {

class cmd_levels : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_levels> {
    std::optional<std::filesystem::path> levels_dir;
    std::optional<std::string> level;  // list the resolved phases of this level
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_levels(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace strata
