#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("strata-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

void write_dummy_file(std::filesystem::path const &path) {
  std::ofstream out{ path };
  out << "strata-test";
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  auto const visitor{ strata::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, var_t{ 42 }) == 84);
  CHECK(std::visit(visitor, var_t{ std::string("hello") }) == 5);
}

TEST_CASE("match with void return") {
  using var_t = std::variant<int, std::string>;

  int int_count{};
  int string_count{};

  auto counter{ strata::match{ [&](int) { ++int_count; },
                               [&](std::string const &) { ++string_count; } } };

  std::visit(counter, var_t{ 1 });
  std::visit(counter, var_t{ std::string("x") });
  std::visit(counter, var_t{ 2 });

  CHECK(int_count == 2);
  CHECK(string_count == 1);
}

TEST_CASE("util_split_words") {
  CHECK(strata::util_split_words("").empty());
  CHECK(strata::util_split_words(" \t\n ").empty());
  CHECK(strata::util_split_words("-j4") == std::vector<std::string>{ "-j4" });
  CHECK(strata::util_split_words("  -j4\t-l8\n V=1 ") ==
        std::vector<std::string>{ "-j4", "-l8", "V=1" });
  // No quoting rules.
  CHECK(strata::util_split_words("CFLAGS='-O2 -g'") ==
        std::vector<std::string>{ "CFLAGS='-O2", "-g'" });
}

TEST_CASE("util_join_argv quotes words with whitespace") {
  CHECK(strata::util_join_argv({}).empty());
  CHECK(strata::util_join_argv({ "make", "-j4" }) == "make -j4");
  CHECK(strata::util_join_argv({ "sh", "-c", "exit 1", "" }) == "sh -c 'exit 1' ''");
}

TEST_CASE("util_tail keeps the end of long text") {
  CHECK(strata::util_tail("short", 10) == "short");
  CHECK(strata::util_tail("0123456789", 10) == "0123456789");
  CHECK(strata::util_tail("0123456789abc", 3) == "... (truncated)\nabc");
}

TEST_CASE("util_tail_buffer trims as it grows") {
  strata::util_tail_buffer buf{ 8 };

  SUBCASE("short input is kept whole") {
    buf.append("abc");
    buf.append("def");
    CHECK(buf.str() == "abcdef");
  }

  SUBCASE("long input keeps the tail and stays bounded") {
    std::string all;
    for (int i{ 0 }; i < 100; ++i) {
      std::string const chunk{ std::to_string(i) + "," };
      buf.append(chunk);
      all += chunk;
      CHECK(buf.retained() <= 16);
    }
    CHECK(buf.str() == strata::util_tail(all, 8));
  }
}

TEST_CASE("scoped_path_cleanup removes file on destruction") {
  auto path = make_temp_path("cleanup");
  write_dummy_file(path);
  REQUIRE(std::filesystem::exists(path));
  {
    strata::scoped_path_cleanup cleanup{ path };
    CHECK(std::filesystem::exists(path));
  }
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto dir = make_temp_path("tree");
  std::filesystem::create_directories(dir / "a" / "b");
  write_dummy_file(dir / "a" / "b" / "file");
  { strata::scoped_path_cleanup cleanup{ dir }; }
  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("scoped_path_cleanup reset switches targets and cleans previous file") {
  auto first = make_temp_path("first");
  auto second = make_temp_path("second");
  write_dummy_file(first);
  write_dummy_file(second);

  {
    strata::scoped_path_cleanup cleanup{ first };
    cleanup.reset(second);
    CHECK_FALSE(std::filesystem::exists(first));
    CHECK(std::filesystem::exists(second));
    CHECK(cleanup.path() == second);
  }

  CHECK_FALSE(std::filesystem::exists(second));
}
