#pragma once

#include "build_context.h"
#include "level_registry.h"

namespace strata {

// Builtin catalog:
//   0  base: pkg_setup, src_unpack, src_compile, src_test, src_install
//   1  src_compile honors the configure-source override
//   2  splits src_compile into src_configure + src_compile, adds src_prepare
void builtin_levels_install(level_registry &registry);

level_registry builtin_level_registry();

// The compile policy of level 1: configure if runnable, then make if a build file
// exists. Either step failing aborts the phase.
void src_compile_configure_and_make(build_context &ctx);

}  // namespace strata
