#pragma once

#include "command_runner.h"
#include "fs_probe.h"
#include "process.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

struct build_config {
  std::optional<std::filesystem::path> econf_source;  // where configure lives
  std::string make{ "make" };
  std::vector<std::string> makeopts;
  std::vector<std::string> extra_emake;
  std::vector<std::string> extra_econf;
  std::string prefix{ "/usr" };
  std::optional<std::string> chost;
};

// Reads ECONF_SOURCE, MAKE, MAKEOPTS, EXTRA_EMAKE, EXTRA_ECONF and CHOST. Empty values
// count as unset.
build_config build_config_from_env(process_env_t const &env);

// Everything one phase run may touch. Not shared across packages.
class build_context : unmovable {
 public:
  build_context(std::filesystem::path workdir,
                build_config cfg,
                command_runner &runner,
                fs_probe const &probe,
                std::string package_label = {});

  std::filesystem::path const &workdir() const { return workdir_; }
  build_config const &cfg() const { return cfg_; }
  command_runner &runner() const { return runner_; }
  fs_probe const &probe() const { return probe_; }
  std::string const &package() const { return package_; }

  // econf_source when set (relative to workdir), otherwise workdir.
  std::filesystem::path configure_source_dir() const;

  // Relative paths are taken relative to workdir.
  std::filesystem::path resolve(std::filesystem::path const &path) const;

  bool exists(std::filesystem::path const &path) const;
  bool is_regular_file(std::filesystem::path const &path) const;
  bool is_executable(std::filesystem::path const &path) const;

 private:
  std::filesystem::path workdir_;
  build_config cfg_;
  command_runner &runner_;
  fs_probe const &probe_;
  std::string package_;
};

}  // namespace strata
