#include "fs_probe.h"

#include "platform.h"

namespace strata {

bool livefs_probe::exists(std::filesystem::path const &path) const {
  return platform::file_exists(path);
}

bool livefs_probe::is_regular_file(std::filesystem::path const &path) const {
  return platform::file_is_regular(path);
}

bool livefs_probe::is_executable(std::filesystem::path const &path) const {
  return platform::file_is_executable(path);
}

}  // namespace strata
