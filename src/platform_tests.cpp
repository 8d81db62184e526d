#include "platform.h"

#include "build_test_fakes.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace strata {

TEST_CASE("platform::file_is_executable") {
  auto const dir{ test::make_temp_dir("platform") };
  scoped_path_cleanup cleanup{ dir };
  test::write_file(dir / "plain", "data");
  test::write_file(dir / "tool", "#!/bin/sh\n", true);

  CHECK(platform::file_exists(dir / "plain"));
  CHECK_FALSE(platform::file_is_executable(dir / "plain"));
  CHECK(platform::file_is_executable(dir / "tool"));
  CHECK_FALSE(platform::file_is_executable(dir));  // directories have x bits too
  CHECK_FALSE(platform::file_exists(dir / "missing"));
  CHECK(platform::file_is_regular(dir / "plain"));
  CHECK_FALSE(platform::file_is_regular(dir));
  CHECK_FALSE(platform::file_is_regular(dir / "missing"));
  CHECK_FALSE(platform::file_is_executable(dir / "missing"));
}

TEST_CASE("platform::find_executable searches PATH in order") {
  auto const dir{ test::make_temp_dir("platform-path") };
  scoped_path_cleanup cleanup{ dir };
  std::filesystem::create_directories(dir / "a");
  std::filesystem::create_directories(dir / "b");
  test::write_file(dir / "a" / "tool", "not executable");
  test::write_file(dir / "b" / "tool", "#!/bin/sh\n", true);

  std::string const path_env{ (dir / "a").string() + ":" + (dir / "b").string() };
  auto const found{ platform::find_executable("tool", path_env) };
  REQUIRE(found);
  CHECK(*found == dir / "b" / "tool");

  CHECK_FALSE(platform::find_executable("missing-tool", path_env));
  CHECK_FALSE(platform::find_executable("", path_env));
  CHECK(platform::find_executable((dir / "b" / "tool").string(), std::nullopt));
}

TEST_CASE("platform::os_name") {
  auto const name{ platform::os_name() };
  CHECK((name == "linux" || name == "darwin"));
}

}  // namespace strata
