#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace strata {

class cmd_phase : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_phase> {
    std::vector<std::string> phases;
    std::string level{ "1" };
    std::optional<std::filesystem::path> workdir;
    std::optional<std::filesystem::path> levels_dir;
    std::optional<std::filesystem::path> econf_source;
    std::optional<std::string> make;
    std::optional<std::string> makeopts;
    std::optional<std::string> prefix;
    std::optional<std::string> package;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_phase(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace strata
