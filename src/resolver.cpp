#include "resolver.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <cstdint>
#include <map>
#include <unordered_set>
#include <utility>

namespace strata {

std::vector<std::string> resolve_chain(level_registry const &registry,
                                       std::string_view level) {
  std::vector<std::string> chain;
  std::unordered_set<std::string> seen;

  std::string current{ level };
  std::string referenced_by;

  while (true) {
    api_level const *def{ registry.find(current) };
    if (!def) { throw unknown_level_error{ current, referenced_by }; }

    chain.push_back(current);
    if (!seen.insert(current).second) { throw cycle_detected_error{ std::move(chain) }; }

    if (!def->predecessor) { break; }
    referenced_by = current;
    current = *def->predecessor;
  }

  return chain;
}

phase_table resolve(level_registry const &registry, std::string_view level) {
  auto const chain{ resolve_chain(registry, level) };

  std::map<std::string, phase_fn> table;
  for (auto it{ chain.rbegin() }; it != chain.rend(); ++it) {
    api_level const &def{ *registry.find(*it) };

    for (auto const &[name, impl] : def.phases) {
      auto slot{ table.find(name) };
      phase_fn inherited{ slot == table.end() ? phase_fn{} : std::move(slot->second) };

      phase_fn bound{ [impl, inherited = std::move(inherited)](build_context &ctx) {
        impl(ctx, inherited);
      } };

      if (slot == table.end()) {
        table.emplace(name, std::move(bound));
      } else {
        slot->second = std::move(bound);
      }
    }
  }

  tui::debug("resolved API level %s: %zu levels, %zu phases",
             chain.front().c_str(),
             chain.size(),
             table.size());
  STRATA_TRACE_LEVEL_RESOLVED(chain.front(),
                              static_cast<std::int64_t>(chain.size()),
                              static_cast<std::int64_t>(table.size()));

  return phase_table{ chain.front(), std::move(table) };
}

}  // namespace strata
