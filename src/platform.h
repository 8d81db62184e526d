#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace strata::platform {

bool file_exists(std::filesystem::path const &path);

// True for a regular file or a symlink to one; false for directories and devices.
bool file_is_regular(std::filesystem::path const &path);

// True for a regular file (or symlink to one) carrying an execute permission the
// current process can use.
bool file_is_executable(std::filesystem::path const &path);

// Search PATH for `name`. Names containing a separator are returned unchanged when
// executable. Returns nullopt if nothing executable is found.
std::optional<std::filesystem::path> find_executable(std::string_view name,
                                                     std::optional<std::string> path_env);

std::string_view os_name();

}  // namespace strata::platform
