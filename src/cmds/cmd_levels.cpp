#include "cmd_levels.h"

#include "cmd_common.h"
#include "resolver.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <utility>

namespace strata {

void cmd_levels::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("levels", "List API levels or one level's phases") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--levels-dir",
                  cfg_ptr->levels_dir,
                  "Directory of Lua level definitions (overrides STRATA_LEVELS_DIR)")
      ->check(CLI::ExistingDirectory);
  sub->add_option("--level", cfg_ptr->level, "Show the resolved phase table of a level");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_levels::cmd_levels(cmd_levels::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_levels::execute() {
  auto const registry{ cmd_load_registry(cfg_.levels_dir, process_getenv()) };

  if (cfg_.level) {
    auto const chain{ resolve_chain(registry, *cfg_.level) };
    auto const table{ resolve(registry, *cfg_.level) };
    for (auto const &name : table.names()) {
      // Report the most specific level that defines each phase.
      std::string defined_by;
      for (auto const &id : chain) {
        if (registry.find(id)->phases.contains(name)) {
          defined_by = id;
          break;
        }
      }
      tui::print_stdout("%s\t%s\n", name.c_str(), defined_by.c_str());
    }
    return;
  }

  for (auto const *level : registry.levels()) {
    tui::print_stdout("%s\t%s\t%s\n",
                      level->id.c_str(),
                      level->predecessor ? level->predecessor->c_str() : "-",
                      level->origin.c_str());
  }
}

}  // namespace strata
