#include "level_registry.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace strata {

void level_registry::add(api_level level) {
  if (level.id.empty()) { throw std::invalid_argument("API level id must not be empty"); }

  if (auto const *existing{ find(level.id) }) {
    throw std::runtime_error("API level '" + level.id + "' from " + level.origin +
                             " is already defined by " + existing->origin);
  }

  if (level.predecessor && level.predecessor->empty()) {
    throw std::runtime_error("API level '" + level.id + "' from " + level.origin +
                             " has an empty predecessor id");
  }

  if (!level.predecessor) {
    if (base_) {
      throw std::runtime_error("API level '" + level.id + "' from " + level.origin +
                               " declares no predecessor, but '" + *base_ +
                               "' is already the base level");
    }
    base_ = level.id;
  }

  tui::debug("registered API level %s (predecessor %s, %zu phases) from %s",
             level.id.c_str(),
             level.predecessor ? level.predecessor->c_str() : "none",
             level.phases.size(),
             level.origin.c_str());
  STRATA_TRACE_LEVEL_LOADED(level.id, level.predecessor.value_or(""), level.origin);

  std::string key{ level.id };
  levels_.emplace(std::move(key), std::move(level));
}

api_level const *level_registry::find(std::string_view id) const {
  auto const it{ levels_.find(id) };
  return it == levels_.end() ? nullptr : &it->second;
}

std::vector<api_level const *> level_registry::levels() const {
  std::vector<api_level const *> out;
  out.reserve(levels_.size());
  for (auto const &[id, level] : levels_) { out.push_back(&level); }
  std::ranges::sort(out, [](api_level const *a, api_level const *b) {
    return level_id_less(a->id, b->id);
  });
  return out;
}

}  // namespace strata
