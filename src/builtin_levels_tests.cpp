#include "builtin_levels.h"

#include "build_test_fakes.h"
#include "errors.h"
#include "phase_executor.h"
#include "resolver.h"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace {

using strata::test::fake_build;

void run_compile(std::string const &level, fake_build &build) {
  auto const registry{ strata::builtin_level_registry() };
  auto const table{ strata::resolve(registry, level) };
  strata::phase_executor{ table }.execute("src_compile", build.ctx);
}

}  // namespace

TEST_CASE("builtin catalog chains 2 -> 1 -> 0") {
  auto const registry{ strata::builtin_level_registry() };
  CHECK(registry.size() == 3);
  REQUIRE(registry.base());
  CHECK(*registry.base() == "0");
  CHECK(strata::resolve_chain(registry, "2") == std::vector<std::string>{ "2", "1", "0" });

  CHECK(strata::resolve(registry, "0").names() ==
        std::vector<std::string>{ "pkg_setup",
                                  "src_compile",
                                  "src_install",
                                  "src_test",
                                  "src_unpack" });
  CHECK(strata::resolve(registry, "2").names() ==
        std::vector<std::string>{ "pkg_setup",
                                  "src_compile",
                                  "src_configure",
                                  "src_install",
                                  "src_prepare",
                                  "src_test",
                                  "src_unpack" });

  for (auto const *level : registry.levels()) { CHECK(level->origin == "builtin"); }
}

TEST_CASE("src_compile runs configure then make") {
  fake_build build;
  build.probe.add("/pkg/configure", true);
  build.probe.add("/pkg/Makefile");

  run_compile("1", build);

  REQUIRE(build.runner.calls.size() == 2);
  CHECK(build.runner.calls[0].name == "./configure");
  CHECK(build.runner.calls[0].cwd == "/pkg");
  CHECK(build.runner.calls[0].args.front() == "--prefix=/usr");
  CHECK(build.runner.calls[1].name == "make");
  CHECK(build.runner.calls[1].args.empty());
  CHECK(build.runner.calls[1].cwd == "/pkg");
}

TEST_CASE("src_compile does not build after configure fails") {
  fake_build build;
  build.probe.add("/pkg/configure", true);
  build.probe.add("/pkg/Makefile");
  build.runner.set_exit_code("./configure", 1);

  try {
    run_compile("1", build);
    FAIL("expected step_failed_error");
  } catch (strata::step_failed_error const &e) {
    CHECK(e.step() == strata::build_step::configure);
    CHECK(e.result().exit_code == 1);
    CHECK(std::string{ e.what() }.find("econf failed") != std::string::npos);
  }
  CHECK(build.runner.names() == std::vector<std::string>{ "./configure" });
}

TEST_CASE("src_compile with nothing to do invokes nothing") {
  fake_build build;
  run_compile("1", build);
  CHECK(build.runner.calls.empty());
}

TEST_CASE("src_compile skips a non-executable configure") {
  fake_build build;
  build.probe.add("/pkg/configure", false);

  SUBCASE("and still builds when a Makefile exists") {
    build.probe.add("/pkg/Makefile");
    run_compile("1", build);
    CHECK(build.runner.names() == std::vector<std::string>{ "make" });
  }

  SUBCASE("and succeeds with no build file") {
    run_compile("1", build);
    CHECK(build.runner.calls.empty());
  }
}

TEST_CASE("src_compile builds with only a lowercase makefile") {
  fake_build build;
  build.probe.add("/pkg/makefile");
  run_compile("1", build);
  CHECK(build.runner.names() == std::vector<std::string>{ "make" });
}

TEST_CASE("src_compile accepts GNUmakefile") {
  fake_build build;
  build.probe.add("/pkg/GNUmakefile");
  run_compile("1", build);
  CHECK(build.runner.names() == std::vector<std::string>{ "make" });
}

TEST_CASE("src_compile reports a failed build step and stops") {
  fake_build build;
  build.probe.add("/pkg/Makefile");
  build.runner.set_exit_code("make", 2);

  try {
    run_compile("1", build);
    FAIL("expected step_failed_error");
  } catch (strata::step_failed_error const &e) {
    CHECK(e.step() == strata::build_step::build);
    CHECK(e.result().label == "make");
    CHECK(e.result().exit_code == 2);
    CHECK(std::string{ e.what() } ==
          "build step failed: emake failed (make exited with code 2)");
  }
  CHECK(build.runner.calls.size() == 1);
}

TEST_CASE("src_compile honors the configure source override") {
  strata::build_config cfg;
  cfg.econf_source = "src";
  fake_build build{ cfg };
  build.probe.add("/pkg/src/configure", true);
  build.probe.add("/pkg/Makefile");

  SUBCASE("level 1 runs configure from the override directory") {
    run_compile("1", build);
    CHECK(build.runner.names() == std::vector<std::string>{ "src/configure", "make" });
    CHECK(build.runner.calls[0].cwd == "/pkg");
  }

  SUBCASE("level 0 only looks in the working directory") {
    run_compile("0", build);
    CHECK(build.runner.names() == std::vector<std::string>{ "make" });
  }
}

TEST_CASE("level 2 splits configure and build into separate phases") {
  fake_build build;
  build.probe.add("/pkg/configure", true);
  build.probe.add("/pkg/Makefile");

  auto const registry{ strata::builtin_level_registry() };
  auto const table{ strata::resolve(registry, "2") };
  strata::phase_executor const exec{ table };

  exec.execute("src_compile", build.ctx);
  CHECK(build.runner.names() == std::vector<std::string>{ "make" });

  exec.execute("src_configure", build.ctx);
  CHECK(build.runner.names() == std::vector<std::string>{ "make", "./configure" });
}

TEST_CASE("builtin no-op phases succeed without running anything") {
  fake_build build;
  build.probe.add("/pkg/configure", true);
  build.probe.add("/pkg/Makefile");

  auto const registry{ strata::builtin_level_registry() };
  auto const table{ strata::resolve(registry, "2") };
  strata::phase_executor{ table }.execute_all(
      { "pkg_setup", "src_unpack", "src_prepare", "src_test", "src_install" },
      build.ctx);
  CHECK(build.runner.calls.empty());
}
