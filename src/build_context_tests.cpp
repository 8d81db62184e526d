#include "build_context.h"

#include "build_test_fakes.h"
#include "builtin_levels.h"
#include "errors.h"
#include "phase_executor.h"
#include "resolver.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("build_config_from_env") {
  SUBCASE("defaults") {
    auto const cfg{ strata::build_config_from_env({}) };
    CHECK_FALSE(cfg.econf_source);
    CHECK(cfg.make == "make");
    CHECK(cfg.makeopts.empty());
    CHECK(cfg.prefix == "/usr");
    CHECK_FALSE(cfg.chost);
  }

  SUBCASE("reads and word-splits variables") {
    strata::process_env_t const env{ { "ECONF_SOURCE", "../src" },
                                     { "MAKE", "gmake" },
                                     { "MAKEOPTS", " -j8  -l4 " },
                                     { "EXTRA_EMAKE", "V=1" },
                                     { "EXTRA_ECONF", "--disable-nls --enable-x" },
                                     { "CHOST", "aarch64-unknown-linux-gnu" } };
    auto const cfg{ strata::build_config_from_env(env) };
    REQUIRE(cfg.econf_source);
    CHECK(*cfg.econf_source == "../src");
    CHECK(cfg.make == "gmake");
    CHECK(cfg.makeopts == std::vector<std::string>{ "-j8", "-l4" });
    CHECK(cfg.extra_emake == std::vector<std::string>{ "V=1" });
    CHECK(cfg.extra_econf == std::vector<std::string>{ "--disable-nls", "--enable-x" });
    CHECK(cfg.chost == "aarch64-unknown-linux-gnu");
  }

  SUBCASE("empty values count as unset") {
    auto const cfg{ strata::build_config_from_env({ { "ECONF_SOURCE", "" },
                                                    { "MAKE", "" } }) };
    CHECK_FALSE(cfg.econf_source);
    CHECK(cfg.make == "make");
  }
}

TEST_CASE("build_context resolves paths against the working directory") {
  strata::build_config cfg;
  cfg.econf_source = "/abs/src";
  strata::test::fake_build build{ cfg };

  CHECK(build.ctx.package() == "pkg");
  CHECK(build.ctx.resolve("configure") == fs::path{ "/pkg/configure" });
  CHECK(build.ctx.resolve("/etc/x") == fs::path{ "/etc/x" });
  CHECK(build.ctx.configure_source_dir() == fs::path{ "/abs/src" });
}

// Exercises the whole stack against the real filesystem and real processes.
TEST_CASE("src_compile builds a package tree with sh scripts") {
  auto const dir{ strata::test::make_temp_dir("compile") };
  strata::scoped_path_cleanup cleanup{ dir };

  // configure records its arguments; the make stand-in records that it ran.
  strata::test::write_file(dir / "configure",
                           "#!/bin/sh\necho \"$@\" > configure.log\n",
                           true);
  strata::test::write_file(dir / "Makefile", "all:\n");
  strata::test::write_file(dir / "fake-make", "#!/bin/sh\necho built > make.log\n", true);

  strata::build_config cfg;
  cfg.make = (dir / "fake-make").string();

  strata::process_command_runner runner{ "compile-test" };
  strata::livefs_probe probe;
  strata::build_context ctx{ dir, cfg, runner, probe };

  auto const registry{ strata::builtin_level_registry() };
  auto const table{ strata::resolve(registry, "1") };
  strata::phase_executor{ table }.execute("src_compile", ctx);

  auto const read{ [](fs::path const &p) {
    std::ifstream in{ p };
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  } };
  CHECK(read(dir / "configure.log").rfind("--prefix=/usr ", 0) == 0);
  CHECK(read(dir / "make.log") == "built\n");
}

TEST_CASE("src_compile stops when a real configure fails") {
  auto const dir{ strata::test::make_temp_dir("compile-fail") };
  strata::scoped_path_cleanup cleanup{ dir };

  strata::test::write_file(dir / "configure", "#!/bin/sh\necho broken >&2\nexit 1\n", true);
  strata::test::write_file(dir / "Makefile", "all:\n");
  strata::test::write_file(dir / "fake-make", "#!/bin/sh\necho built > make.log\n", true);

  strata::build_config cfg;
  cfg.make = (dir / "fake-make").string();

  strata::process_command_runner runner{ "compile-test" };
  strata::livefs_probe probe;
  strata::build_context ctx{ dir, cfg, runner, probe };

  auto const registry{ strata::builtin_level_registry() };
  auto const table{ strata::resolve(registry, "1") };

  try {
    strata::phase_executor{ table }.execute("src_compile", ctx);
    FAIL("expected step_failed_error");
  } catch (strata::step_failed_error const &e) {
    CHECK(e.step() == strata::build_step::configure);
    CHECK(e.result().captured_output == "broken\n");
  }
  CHECK_FALSE(fs::exists(dir / "make.log"));
}

TEST_CASE("src_compile ignores a directory named Makefile") {
  auto const dir{ strata::test::make_temp_dir("compile-dir-makefile") };
  strata::scoped_path_cleanup cleanup{ dir };
  fs::create_directories(dir / "Makefile");
  fs::create_directories(dir / "makefile");

  strata::test::recording_runner runner;
  strata::livefs_probe probe;
  strata::build_context ctx{ dir, {}, runner, probe };

  auto const registry{ strata::builtin_level_registry() };
  auto const table{ strata::resolve(registry, "1") };
  strata::phase_executor{ table }.execute("src_compile", ctx);

  CHECK(runner.calls.empty());
}
