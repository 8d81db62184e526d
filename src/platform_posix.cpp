#include "platform.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace strata::platform {

bool file_exists(std::filesystem::path const &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

bool file_is_regular(std::filesystem::path const &path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) { return false; }
  return S_ISREG(st.st_mode);
}

bool file_is_executable(std::filesystem::path const &path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) { return false; }
  if (!S_ISREG(st.st_mode)) { return false; }
  return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> find_executable(std::string_view name,
                                                     std::optional<std::string> path_env) {
  if (name.empty()) { return std::nullopt; }

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path candidate{ name };
    if (file_is_executable(candidate)) { return candidate; }
    return std::nullopt;
  }

  std::string_view dirs{ path_env ? std::string_view{ *path_env }
                                  : std::string_view{ "/usr/local/bin:/usr/bin:/bin" } };
  while (true) {
    auto const sep{ dirs.find(':') };
    auto const dir{ dirs.substr(0, sep) };
    std::filesystem::path candidate{ dir.empty() ? std::filesystem::path{ "." }
                                                 : std::filesystem::path{ dir } };
    candidate /= name;
    if (file_is_executable(candidate)) { return candidate; }
    if (sep == std::string_view::npos) { break; }
    dirs.remove_prefix(sep + 1);
  }

  return std::nullopt;
}

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "darwin";
#elif defined(__linux__)
  return "linux";
#else
#error "unsupported POSIX OS"
#endif
}

}  // namespace strata::platform
