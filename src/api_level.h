#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

class build_context;

// A resolved, callable phase implementation.
using phase_fn = std::function<void(build_context &)>;

// One level's definition of a phase. `inherited` is what the lower levels resolved
// to for the same name; it is empty when no lower level defines the phase. Calling it
// is how a definition extends rather than replaces.
using phase_def = std::function<void(build_context &, phase_fn const &inherited)>;

struct api_level {
  std::string id;
  std::optional<std::string> predecessor;  // nullopt for the base level
  std::string origin;                      // "builtin" or the definition file path
  std::map<std::string, phase_def> phases;
};

// Ordering for display: numeric when both ids are non-negative integers, lexical
// otherwise (numbers sort before names).
bool level_id_less(std::string_view a, std::string_view b);

class phase_table {
 public:
  phase_table(std::string level, std::map<std::string, phase_fn> entries);

  std::string const &level() const { return level_; }

  phase_fn const *find(std::string_view phase) const;
  bool contains(std::string_view phase) const { return find(phase) != nullptr; }
  std::vector<std::string> names() const;
  size_t size() const { return entries_.size(); }

 private:
  std::string level_;
  std::map<std::string, phase_fn, std::less<>> entries_;
};

}  // namespace strata
