#pragma once

#include "api_level.h"
#include "level_registry.h"

#include <filesystem>

namespace strata {

// Loads one Lua level definition. The level id is the file stem ("3.lua" -> "3").
//
//   PREDECESSOR = "2"            -- omit only for a base level
//   PHASES = {
//     src_compile = function(ctx, super)
//       if super then super() end  -- run the inherited definition
//       ctx.emake({ "docs" })
//     end,
//   }
//
// ctx fields: workdir, level, phase, package, configure_source.
// ctx functions (call with '.', not ':'): exists(path), is_executable(path),
// find_build_file(), run(cmd, args) -> exit code, econf(args), emake(args),
// die(reason), log(msg). Failures raised by econf/emake/die/super propagate with their
// C++ type, even if the script catches them with pcall.
api_level lua_level_load_file(std::filesystem::path const &path);

// Loads every *.lua file in `dir` into `registry`, in level_id_less order.
void lua_level_load_dir(level_registry &registry, std::filesystem::path const &dir);

}  // namespace strata
