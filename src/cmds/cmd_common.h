#pragma once

#include "level_registry.h"
#include "process.h"

#include <filesystem>
#include <optional>

namespace strata {

// Builtin levels plus any Lua definitions from `levels_dir`, or from STRATA_LEVELS_DIR
// in `env` when no directory is given.
level_registry cmd_load_registry(std::optional<std::filesystem::path> const &levels_dir,
                                 process_env_t const &env);

}  // namespace strata
