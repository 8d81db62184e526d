#pragma once

#include "build_context.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// Probe order matters: the first name present wins.
inline constexpr std::array<std::string_view, 3> kBuildFileNames{ "Makefile",
                                                                  "GNUmakefile",
                                                                  "makefile" };

std::optional<std::string> find_build_file(build_context const &ctx);

// True when <configure_source_dir>/configure exists and is executable.
bool has_runnable_configure(build_context const &ctx);

// Runs configure with the default option set. Throws step_failed_error{configure} when
// it fails and build_abort_error when there is no configure script to run.
void econf(build_context &ctx, std::vector<std::string> const &extra = {});

// Runs make with MAKEOPTS / EXTRA_EMAKE. Throws step_failed_error{build} on failure.
void emake(build_context &ctx, std::vector<std::string> const &extra = {});

// Default configure options, without EXTRA_ECONF or caller extras.
std::vector<std::string> econf_default_options(build_config const &cfg);

[[noreturn]] void die(std::string const &reason);

}  // namespace strata
