#include "cmd_common.h"

#include "builtin_levels.h"
#include "lua_level.h"

namespace strata {

level_registry cmd_load_registry(std::optional<std::filesystem::path> const &levels_dir,
                                 process_env_t const &env) {
  level_registry registry{ builtin_level_registry() };

  std::optional<std::filesystem::path> dir{ levels_dir };
  if (!dir) {
    if (auto const it{ env.find("STRATA_LEVELS_DIR") };
        it != env.end() && !it->second.empty()) {
      dir = it->second;
    }
  }

  if (dir) { lua_level_load_dir(registry, *dir); }
  return registry;
}

}  // namespace strata
