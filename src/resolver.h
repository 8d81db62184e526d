#pragma once

#include "api_level.h"
#include "level_registry.h"

#include <string>
#include <string_view>
#include <vector>

namespace strata {

// Ids from `level` down to its base, most specific first. Throws unknown_level_error
// or cycle_detected_error.
std::vector<std::string> resolve_chain(level_registry const &registry,
                                       std::string_view level);

// Flattens the chain into a phase table: base definitions first, each higher level
// overlaying its own entries and binding the entry it replaces as `inherited`.
phase_table resolve(level_registry const &registry, std::string_view level);

}  // namespace strata
