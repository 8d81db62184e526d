#pragma once

#include "command_runner.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// A level id, or an ancestor named by some level's predecessor link, is not known to
// the registry.
class unknown_level_error : public std::runtime_error {
 public:
  unknown_level_error(std::string level, std::string referenced_by);

  std::string const &level() const { return level_; }
  std::string const &referenced_by() const { return referenced_by_; }  // empty if requested

 private:
  std::string level_;
  std::string referenced_by_;
};

// Predecessor links loop. `chain` lists the walk from the requested level up to and
// including the first repeated id.
class cycle_detected_error : public std::runtime_error {
 public:
  explicit cycle_detected_error(std::vector<std::string> chain);

  std::vector<std::string> const &chain() const { return chain_; }

 private:
  std::vector<std::string> chain_;
};

class unknown_phase_error : public std::runtime_error {
 public:
  unknown_phase_error(std::string level, std::string phase);

  std::string const &level() const { return level_; }
  std::string const &phase() const { return phase_; }

 private:
  std::string level_;
  std::string phase_;
};

// Terminates the current package build. Raised through die() and by anything that makes
// continuing unsafe.
class build_abort_error : public std::runtime_error {
 public:
  explicit build_abort_error(std::string const &reason);
};

enum class build_step { configure, build };

std::string_view build_step_name(build_step step);

class step_failed_error : public build_abort_error {
 public:
  step_failed_error(build_step step, std::string const &reason, command_result result);

  build_step step() const { return step_; }
  command_result const &result() const { return result_; }

 private:
  build_step step_;
  command_result result_;
};

}  // namespace strata
