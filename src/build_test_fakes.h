#pragma once

// Test doubles for build_context: a runner that records instead of spawning and a probe
// backed by an in-memory file and directory set. Test-only.

#include "build_context.h"
#include "command_runner.h"
#include "fs_probe.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

namespace strata::test {

struct recorded_command {
  std::string name;
  std::vector<std::string> args;
  std::filesystem::path cwd;
};

class recording_runner : public command_runner {
 public:
  // Commands not listed exit 0.
  void set_exit_code(std::string name, int code) { exit_codes_[std::move(name)] = code; }

  command_result run(std::string_view name,
                     std::vector<std::string> const &args,
                     std::filesystem::path const &cwd) override {
    calls.push_back({ .name = std::string{ name }, .args = args, .cwd = cwd });

    command_result result{ .label = std::string{ name } };
    result.argv.emplace_back(name);
    result.argv.insert(result.argv.end(), args.begin(), args.end());
    if (auto const it{ exit_codes_.find(result.label) }; it != exit_codes_.end()) {
      result.exit_code = it->second;
    }
    return result;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (auto const &c : calls) { out.push_back(c.name); }
    return out;
  }

  std::vector<recorded_command> calls;

 private:
  std::map<std::string, int> exit_codes_;
};

class memory_probe : public fs_probe {
 public:
  void add(std::filesystem::path const &path, bool executable = false) {
    files_.insert(path.lexically_normal());
    if (executable) { executables_.insert(path.lexically_normal()); }
  }

  void add_dir(std::filesystem::path const &path) { dirs_.insert(path.lexically_normal()); }

  bool exists(std::filesystem::path const &path) const override {
    auto const p{ path.lexically_normal() };
    return files_.contains(p) || dirs_.contains(p);
  }

  bool is_regular_file(std::filesystem::path const &path) const override {
    return files_.contains(path.lexically_normal());
  }

  bool is_executable(std::filesystem::path const &path) const override {
    return executables_.contains(path.lexically_normal());
  }

 private:
  std::set<std::filesystem::path> files_;
  std::set<std::filesystem::path> executables_;
  std::set<std::filesystem::path> dirs_;
};

// A build_context over /pkg with its own runner and probe.
struct fake_build {
  explicit fake_build(build_config cfg = {}) : ctx{ "/pkg", std::move(cfg), runner, probe } {}

  recording_runner runner;
  memory_probe probe;
  build_context ctx;
};

// Fresh directory under the system temp dir; pair with scoped_path_cleanup.
inline std::filesystem::path make_temp_dir(std::string_view tag) {
  static int counter{ 0 };
  auto dir{ std::filesystem::temp_directory_path() /
            ("strata-" + std::string{ tag } + "-" + std::to_string(::getpid()) + "-" +
             std::to_string(++counter)) };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(std::filesystem::path const &path,
                       std::string_view content,
                       bool executable = false) {
  {
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    out << content;
  }
  auto const perms{ executable ? std::filesystem::perms::owner_all
                               : std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write };
  std::filesystem::permissions(path, perms);
}

}  // namespace strata::test
