#pragma once

#include "api_level.h"
#include "build_context.h"

#include <string>
#include <string_view>
#include <vector>

namespace strata {

// Runs phases from a resolved table. Any failure propagates as an exception after a
// diagnostic naming the phase (and, for step failures, the step) has been logged.
class phase_executor {
 public:
  explicit phase_executor(phase_table const &table);

  // Throws unknown_phase_error, step_failed_error, build_abort_error.
  void execute(std::string_view phase, build_context &ctx) const;

  // Runs each phase in order; the first failure stops the sequence.
  void execute_all(std::vector<std::string> const &phases, build_context &ctx) const;

  phase_table const &table() const { return table_; }

 private:
  phase_table const &table_;
};

}  // namespace strata
