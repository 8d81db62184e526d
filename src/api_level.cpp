#include "api_level.h"

#include <algorithm>
#include <utility>

namespace strata {

namespace {

bool is_number(std::string_view s) {
  return !s.empty() && std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view strip_leading_zeros(std::string_view s) {
  while (s.size() > 1 && s.front() == '0') { s.remove_prefix(1); }
  return s;
}

}  // namespace

bool level_id_less(std::string_view a, std::string_view b) {
  bool const a_num{ is_number(a) };
  bool const b_num{ is_number(b) };

  if (a_num && b_num) {
    auto const na{ strip_leading_zeros(a) };
    auto const nb{ strip_leading_zeros(b) };
    if (na.size() != nb.size()) { return na.size() < nb.size(); }
    return na < nb;
  }
  if (a_num != b_num) { return a_num; }
  return a < b;
}

phase_table::phase_table(std::string level, std::map<std::string, phase_fn> entries)
    : level_{ std::move(level) }, entries_{ entries.begin(), entries.end() } {}

phase_fn const *phase_table::find(std::string_view phase) const {
  auto const it{ entries_.find(phase) };
  return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> phase_table::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (auto const &[name, fn] : entries_) { out.push_back(name); }
  return out;
}

}  // namespace strata
