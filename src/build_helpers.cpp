#include "build_helpers.h"

#include "errors.h"
#include "tui.h"

#include <utility>

namespace strata {

namespace {

std::string configure_command(build_context const &ctx) {
  if (!ctx.cfg().econf_source) { return "./configure"; }
  return (*ctx.cfg().econf_source / "configure").string();
}

void log_failure_output(build_context const &ctx, command_result const &result) {
  if (result.captured_output.empty()) { return; }
  tui::error("[%s] %s stderr:\n%s",
             ctx.package().c_str(),
             result.label.c_str(),
             result.captured_output.c_str());
}

}  // namespace

std::optional<std::string> find_build_file(build_context const &ctx) {
  for (auto const name : kBuildFileNames) {
    if (ctx.is_regular_file(name)) { return std::string{ name }; }
  }
  return std::nullopt;
}

bool has_runnable_configure(build_context const &ctx) {
  auto const script{ ctx.configure_source_dir() / "configure" };
  return ctx.exists(script) && ctx.is_executable(script);
}

std::vector<std::string> econf_default_options(build_config const &cfg) {
  std::vector<std::string> opts{
    "--prefix=" + cfg.prefix,
    "--mandir=" + cfg.prefix + "/share/man",
    "--infodir=" + cfg.prefix + "/share/info",
    "--datadir=" + cfg.prefix + "/share",
    "--sysconfdir=/etc",
    "--localstatedir=/var/lib",
  };
  if (cfg.chost) { opts.push_back("--host=" + *cfg.chost); }
  return opts;
}

void econf(build_context &ctx, std::vector<std::string> const &extra) {
  auto const script{ ctx.configure_source_dir() / "configure" };
  if (!ctx.exists(script)) {
    die("econf: no configure script found at " + script.string());
  }

  std::vector<std::string> args{ econf_default_options(ctx.cfg()) };
  args.insert(args.end(), ctx.cfg().extra_econf.begin(), ctx.cfg().extra_econf.end());
  args.insert(args.end(), extra.begin(), extra.end());

  command_result result{ ctx.runner().run(configure_command(ctx), args, ctx.workdir()) };
  if (!result.ok()) {
    log_failure_output(ctx, result);
    throw step_failed_error{ build_step::configure, "econf failed", std::move(result) };
  }
}

void emake(build_context &ctx, std::vector<std::string> const &extra) {
  std::vector<std::string> args{ ctx.cfg().makeopts };
  args.insert(args.end(), ctx.cfg().extra_emake.begin(), ctx.cfg().extra_emake.end());
  args.insert(args.end(), extra.begin(), extra.end());

  command_result result{ ctx.runner().run(ctx.cfg().make, args, ctx.workdir()) };
  if (!result.ok()) {
    log_failure_output(ctx, result);
    throw step_failed_error{ build_step::build, "emake failed", std::move(result) };
  }
}

void die(std::string const &reason) { throw build_abort_error{ reason }; }

}  // namespace strata
