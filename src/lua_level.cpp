#include "lua_level.h"

#include "build_context.h"
#include "build_helpers.h"
#include "errors.h"
#include "sol_util.h"
#include "tui.h"

#include "sol/sol.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace strata {

namespace {

struct lua_phase_impl {
  std::shared_ptr<sol::state> lua;  // declared first: outlives fn
  sol::protected_function fn;
  std::string level;
  std::string phase;
};

// Per-call state shared with the ctx closures. Closures that escape the call (stashed
// in a global, say) find ctx == nullptr and raise instead of touching a dead context.
struct lua_phase_frame {
  build_context *ctx;
  std::exception_ptr pending;

  build_context &require(char const *fn_name) const {
    if (!ctx) {
      throw std::runtime_error(std::string{ "ctx." } + fn_name +
                               ": called outside of its phase");
    }
    return *ctx;
  }

  // The first failure is kept so it can be rethrown with its type once control is
  // back in C++.
  template <typename F>
  auto guarded(F &&f) {
    try {
      return f();
    } catch (std::exception const &) {
      if (!pending) { pending = std::current_exception(); }
      throw;
    }
  }
};

std::vector<std::string> table_to_args(sol::optional<sol::table> const &args,
                                       char const *fn_name) {
  std::vector<std::string> out;
  if (!args) { return out; }

  std::size_t const n{ args->size() };
  out.reserve(n);
  for (std::size_t i{ 1 }; i <= n; ++i) {
    sol::object const value{ args->get<sol::object>(i) };
    if (!value.is<std::string>()) {
      throw std::runtime_error(std::string{ "ctx." } + fn_name +
                               ": arguments must be strings (index " +
                               std::to_string(i) + ")");
    }
    out.push_back(value.as<std::string>());
  }
  return out;
}

sol::table make_ctx_table(sol::state &lua,
                          std::shared_ptr<lua_phase_frame> const &frame,
                          lua_phase_impl const &impl) {
  build_context &ctx{ *frame->ctx };

  sol::table t{ lua.create_table() };
  t["workdir"] = ctx.workdir().string();
  t["level"] = impl.level;
  t["phase"] = impl.phase;
  t["package"] = ctx.package();
  t["configure_source"] = ctx.configure_source_dir().string();

  t.set_function("exists", [frame](std::string const &path) {
    return frame->require("exists").exists(path);
  });

  t.set_function("is_executable", [frame](std::string const &path) {
    return frame->require("is_executable").is_executable(path);
  });

  t.set_function("find_build_file", [frame]() -> sol::optional<std::string> {
    if (auto found{ find_build_file(frame->require("find_build_file")) }) {
      return *found;
    }
    return sol::nullopt;
  });

  t.set_function("run", [frame](std::string const &cmd, sol::optional<sol::table> args) {
    build_context &c{ frame->require("run") };
    auto const argv{ table_to_args(args, "run") };
    return frame->guarded([&] { return c.runner().run(cmd, argv, c.workdir()).exit_code; });
  });

  t.set_function("econf", [frame](sol::optional<sol::table> args) {
    build_context &c{ frame->require("econf") };
    auto const extra{ table_to_args(args, "econf") };
    frame->guarded([&] { econf(c, extra); });
  });

  t.set_function("emake", [frame](sol::optional<sol::table> args) {
    build_context &c{ frame->require("emake") };
    auto const extra{ table_to_args(args, "emake") };
    frame->guarded([&] { emake(c, extra); });
  });

  t.set_function("die", [frame](std::string const &reason) {
    frame->require("die");
    frame->guarded([&] { die(reason); });
  });

  t.set_function("log", [frame](std::string const &msg) {
    build_context &c{ frame->require("log") };
    tui::info("[%s] %s", c.package().c_str(), msg.c_str());
  });

  return t;
}

void call_lua_phase(lua_phase_impl const &impl,
                    build_context &ctx,
                    phase_fn const &inherited) {
  sol::state &lua{ *impl.lua };
  auto frame{ std::make_shared<lua_phase_frame>(lua_phase_frame{ &ctx, nullptr }) };

  sol::table ctx_table{ make_ctx_table(lua, frame, impl) };

  sol::object super{ sol::lua_nil };
  if (inherited) {
    super = sol::make_object(lua, sol::as_function([frame, inherited]() {
      build_context &c{ frame->require("super") };
      frame->guarded([&] { inherited(c); });
    }));
  }

  sol::protected_function_result result{ impl.fn(ctx_table, super) };
  frame->ctx = nullptr;

  if (frame->pending) { std::rethrow_exception(frame->pending); }

  if (!result.valid()) {
    sol::error err = result;
    throw build_abort_error{ "API level " + impl.level + " " + impl.phase + ": " +
                             err.what() };
  }
}

}  // namespace

api_level lua_level_load_file(std::filesystem::path const &path) {
  std::shared_ptr<sol::state> lua{ sol_util_make_lua_state() };
  std::string const origin{ path.string() };

  sol::protected_function_result loaded{
    lua->safe_script_file(origin, sol::script_pass_on_error)
  };
  if (!loaded.valid()) {
    sol::error err = loaded;
    throw std::runtime_error("failed to load API level " + origin + ": " + err.what());
  }

  sol::table globals{ lua->globals() };
  auto predecessor{ sol_util_get_optional<std::string>(globals, "PREDECESSOR", origin) };
  auto phases{ sol_util_get_required<sol::table>(globals, "PHASES", origin) };

  api_level level{ .id = path.stem().string(),
                   .predecessor = std::move(predecessor),
                   .origin = origin,
                   .phases = {} };

  for (auto const &[key, value] : phases) {
    if (!key.is<std::string>()) {
      throw std::runtime_error(origin + ": PHASES keys must be phase names");
    }
    std::string name{ key.as<std::string>() };
    if (value.get_type() != sol::type::function) {
      throw std::runtime_error(origin + ": PHASES." + name + " must be a function");
    }

    auto impl{ std::make_shared<lua_phase_impl>(
        lua_phase_impl{ .lua = lua,
                        .fn = value.as<sol::protected_function>(),
                        .level = level.id,
                        .phase = name }) };
    level.phases.emplace(std::move(name),
                         [impl](build_context &ctx, phase_fn const &inherited) {
                           call_lua_phase(*impl, ctx, inherited);
                         });
  }

  return level;
}

void lua_level_load_dir(level_registry &registry, std::filesystem::path const &dir) {
  if (!std::filesystem::is_directory(dir)) {
    throw std::runtime_error("API level directory not found: " + dir.string());
  }

  std::vector<std::filesystem::path> files;
  for (auto const &entry : std::filesystem::directory_iterator{ dir }) {
    if (entry.is_regular_file() && entry.path().extension() == ".lua") {
      files.push_back(entry.path());
    }
  }

  std::ranges::sort(files, [](auto const &a, auto const &b) {
    return level_id_less(a.stem().string(), b.stem().string());
  });

  for (auto const &file : files) {
    tui::debug("loading API level definition %s", file.c_str());
    registry.add(lua_level_load_file(file));
  }
}

}  // namespace strata
