#include "cmd_phase.h"

#include "build_context.h"
#include "cmd_common.h"
#include "command_runner.h"
#include "fs_probe.h"
#include "phase_executor.h"
#include "resolver.h"
#include "tui.h"
#include "util.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <utility>

namespace strata {

void cmd_phase::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("phase", "Run build phases in a working directory") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("phases", cfg_ptr->phases, "Phases to run, in order (e.g. src_compile)")
      ->required();
  sub->add_option("--level", cfg_ptr->level, "API level to resolve phases against")
      ->capture_default_str();
  sub->add_option("--workdir", cfg_ptr->workdir, "Package working directory")
      ->check(CLI::ExistingDirectory);
  sub->add_option("--levels-dir",
                  cfg_ptr->levels_dir,
                  "Directory of Lua level definitions (overrides STRATA_LEVELS_DIR)")
      ->check(CLI::ExistingDirectory);
  sub->add_option("--econf-source",
                  cfg_ptr->econf_source,
                  "Directory holding configure (overrides ECONF_SOURCE)");
  sub->add_option("--make", cfg_ptr->make, "Make program (overrides MAKE)");
  sub->add_option("--makeopts", cfg_ptr->makeopts, "Make options (overrides MAKEOPTS)");
  sub->add_option("--prefix", cfg_ptr->prefix, "Install prefix passed to configure");
  sub->add_option("--package", cfg_ptr->package, "Package label for logs and traces");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_phase::cmd_phase(cmd_phase::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_phase::execute() {
  auto const env{ process_getenv() };

  build_config build_cfg{ build_config_from_env(env) };
  if (cfg_.econf_source) { build_cfg.econf_source = *cfg_.econf_source; }
  if (cfg_.make) { build_cfg.make = *cfg_.make; }
  if (cfg_.makeopts) { build_cfg.makeopts = util_split_words(*cfg_.makeopts); }
  if (cfg_.prefix) { build_cfg.prefix = *cfg_.prefix; }

  auto const registry{ cmd_load_registry(cfg_.levels_dir, env) };
  auto const table{ resolve(registry, cfg_.level) };

  auto const workdir{ std::filesystem::absolute(
      cfg_.workdir.value_or(std::filesystem::current_path())) };
  std::string const package{ cfg_.package.value_or(workdir.filename().string()) };

  tui::debug("[%s] level %s, workdir %s",
             package.c_str(),
             cfg_.level.c_str(),
             workdir.c_str());

  process_command_runner runner{ package, env };
  livefs_probe probe;
  build_context ctx{ workdir, std::move(build_cfg), runner, probe, package };

  phase_executor{ table }.execute_all(cfg_.phases, ctx);
  tui::info("[%s] %s complete", package.c_str(), util_join_argv(cfg_.phases).c_str());
}

}  // namespace strata
