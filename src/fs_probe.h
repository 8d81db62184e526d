#pragma once

#include "util.h"

#include <filesystem>

namespace strata {

class fs_probe : unmovable {
 public:
  virtual ~fs_probe() = default;

  virtual bool exists(std::filesystem::path const &path) const = 0;
  virtual bool is_regular_file(std::filesystem::path const &path) const = 0;
  virtual bool is_executable(std::filesystem::path const &path) const = 0;

 protected:
  fs_probe() = default;
};

// Answers from the live filesystem.
class livefs_probe : public fs_probe {
 public:
  bool exists(std::filesystem::path const &path) const override;
  bool is_regular_file(std::filesystem::path const &path) const override;
  bool is_executable(std::filesystem::path const &path) const override;
};

}  // namespace strata
