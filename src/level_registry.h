#pragma once

#include "api_level.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// The level-chain catalog: every known level definition, keyed by id. Admits exactly
// one base level (no predecessor). Predecessor ids are not checked on add so that
// definitions may arrive in any order; the resolver reports dangling links.
class level_registry {
 public:
  void add(api_level level);

  api_level const *find(std::string_view id) const;
  std::vector<api_level const *> levels() const;  // ordered by level_id_less

  std::optional<std::string> const &base() const { return base_; }
  size_t size() const { return levels_.size(); }

 private:
  std::map<std::string, api_level, std::less<>> levels_;
  std::optional<std::string> base_;
};

}  // namespace strata
