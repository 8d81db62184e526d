#include "build_context.h"

#include "trace.h"

#include <utility>

namespace strata {

namespace {

std::optional<std::string> env_value(process_env_t const &env, char const *name) {
  auto const it{ env.find(name) };
  if (it == env.end() || it->second.empty()) { return std::nullopt; }
  return it->second;
}

}  // namespace

build_config build_config_from_env(process_env_t const &env) {
  build_config cfg;
  if (auto v{ env_value(env, "ECONF_SOURCE") }) { cfg.econf_source = *v; }
  if (auto v{ env_value(env, "MAKE") }) { cfg.make = *v; }
  if (auto v{ env_value(env, "MAKEOPTS") }) { cfg.makeopts = util_split_words(*v); }
  if (auto v{ env_value(env, "EXTRA_EMAKE") }) { cfg.extra_emake = util_split_words(*v); }
  if (auto v{ env_value(env, "EXTRA_ECONF") }) { cfg.extra_econf = util_split_words(*v); }
  if (auto v{ env_value(env, "CHOST") }) { cfg.chost = *v; }
  return cfg;
}

build_context::build_context(std::filesystem::path workdir,
                             build_config cfg,
                             command_runner &runner,
                             fs_probe const &probe,
                             std::string package_label)
    : workdir_{ std::move(workdir) },
      cfg_{ std::move(cfg) },
      runner_{ runner },
      probe_{ probe },
      package_{ package_label.empty() ? workdir_.filename().string()
                                      : std::move(package_label) } {}

std::filesystem::path build_context::configure_source_dir() const {
  if (cfg_.econf_source) { return resolve(*cfg_.econf_source); }
  return workdir_;
}

std::filesystem::path build_context::resolve(std::filesystem::path const &path) const {
  if (path.is_absolute()) { return path; }
  return workdir_ / path;
}

bool build_context::exists(std::filesystem::path const &path) const {
  auto const full{ resolve(path) };
  bool const result{ probe_.exists(full) };
  STRATA_TRACE_PROBE_CHECK(package_, full.string(), "exists", result);
  return result;
}

bool build_context::is_regular_file(std::filesystem::path const &path) const {
  auto const full{ resolve(path) };
  bool const result{ probe_.is_regular_file(full) };
  STRATA_TRACE_PROBE_CHECK(package_, full.string(), "regular", result);
  return result;
}

bool build_context::is_executable(std::filesystem::path const &path) const {
  auto const full{ resolve(path) };
  bool const result{ probe_.is_executable(full) };
  STRATA_TRACE_PROBE_CHECK(package_, full.string(), "executable", result);
  return result;
}

}  // namespace strata
