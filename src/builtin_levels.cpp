#include "builtin_levels.h"

#include "build_helpers.h"
#include "tui.h"

#include <utility>

namespace strata {

namespace {

constexpr char kBuiltinOrigin[]{ "builtin" };

void noop_phase(build_context &, phase_fn const &) {}

void make_if_build_file(build_context &ctx) {
  if (auto const build_file{ find_build_file(ctx) }) {
    tui::debug("[%s] found %s", ctx.package().c_str(), build_file->c_str());
    emake(ctx);
  } else {
    tui::debug("[%s] no Makefile, GNUmakefile or makefile; skipping make",
               ctx.package().c_str());
  }
}

// Level 0 only looks for configure in the working directory.
void level0_src_compile(build_context &ctx, phase_fn const &) {
  if (ctx.exists("configure") && ctx.is_executable("configure")) { econf(ctx); }
  make_if_build_file(ctx);
}

void level1_src_compile(build_context &ctx, phase_fn const &) {
  src_compile_configure_and_make(ctx);
}

void level2_src_configure(build_context &ctx, phase_fn const &) {
  if (has_runnable_configure(ctx)) { econf(ctx); }
}

void level2_src_compile(build_context &ctx, phase_fn const &) { make_if_build_file(ctx); }

api_level make_level(std::string id, std::optional<std::string> predecessor) {
  return api_level{ .id = std::move(id),
                    .predecessor = std::move(predecessor),
                    .origin = kBuiltinOrigin,
                    .phases = {} };
}

}  // namespace

void src_compile_configure_and_make(build_context &ctx) {
  if (has_runnable_configure(ctx)) {
    econf(ctx);
  } else {
    tui::debug("[%s] no executable configure in %s",
               ctx.package().c_str(),
               ctx.configure_source_dir().c_str());
  }
  make_if_build_file(ctx);
}

void builtin_levels_install(level_registry &registry) {
  auto level0{ make_level("0", std::nullopt) };
  level0.phases.emplace("pkg_setup", noop_phase);
  level0.phases.emplace("src_unpack", noop_phase);
  level0.phases.emplace("src_compile", level0_src_compile);
  level0.phases.emplace("src_test", noop_phase);
  level0.phases.emplace("src_install", noop_phase);
  registry.add(std::move(level0));

  auto level1{ make_level("1", "0") };
  level1.phases.emplace("src_compile", level1_src_compile);
  registry.add(std::move(level1));

  auto level2{ make_level("2", "1") };
  level2.phases.emplace("src_prepare", noop_phase);
  level2.phases.emplace("src_configure", level2_src_configure);
  level2.phases.emplace("src_compile", level2_src_compile);
  registry.add(std::move(level2));
}

level_registry builtin_level_registry() {
  level_registry registry;
  builtin_levels_install(registry);
  return registry;
}

}  // namespace strata
