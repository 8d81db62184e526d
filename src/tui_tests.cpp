#include "tui.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(strata::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(strata::tui::set_output_handler(handler));
  CHECK_NOTHROW(strata::tui::run(strata::tui::level::TUI_INFO));
  CHECK_NOTHROW(strata::tui::shutdown());

  CHECK_NOTHROW(strata::tui::run(std::nullopt));
  CHECK_THROWS_AS(strata::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(strata::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(strata::tui::shutdown());
  CHECK_THROWS_AS(strata::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(strata::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    // Drop anything other tests queued while the worker was stopped.
    strata::tui::set_output_handler([](std::string_view) {});
    strata::tui::run(std::nullopt);
    strata::tui::shutdown();

    strata::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      strata::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

std::vector<std::string> read_lines(std::filesystem::path const &path) {
  std::vector<std::string> lines;
  std::ifstream file{ path };
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty()) { lines.push_back(line); }
  }
  return lines;
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  CHECK_NOTHROW(strata::tui::run(std::nullopt));

  strata::tui::debug("hello %s", "world");
  strata::tui::info("value %d", 42);
  strata::tui::warn("three %d", 3);
  strata::tui::error("boom");

  CHECK_NOTHROW(strata::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(strata::tui::run(strata::tui::level::TUI_DEBUG, true));
  strata::tui::info("structured %d", 7);
  CHECK_NOTHROW(strata::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") ==
        line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(strata::tui::run(strata::tui::level::TUI_WARN, true));
  strata::tui::debug("debug");
  strata::tui::info("info");
  strata::tui::warn("warn");
  strata::tui::error("error");
  CHECK_NOTHROW(strata::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  strata::tui::configure_trace_outputs(
      { { strata::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(strata::tui::run(strata::tui::level::TUI_TRACE, false));

  STRATA_TRACE_PHASE_START("zlib", "2", "src_compile");

  CHECK_NOTHROW(strata::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "phase_start package=zlib level=2 phase=src_compile\n");

  strata::tui::configure_trace_outputs({});
}

TEST_CASE("g_trace_enabled follows the configured outputs") {
  CHECK_FALSE(strata::tui::g_trace_enabled);

  strata::tui::configure_trace_outputs(
      { { strata::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(strata::tui::g_trace_enabled);

  strata::tui::configure_trace_outputs({});
  CHECK_FALSE(strata::tui::g_trace_enabled);

  // Dropped, not queued, while tracing is off.
  STRATA_TRACE_STEP_FAILED("p", "src_compile", "build", 2);
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  auto const path1{ std::filesystem::temp_directory_path() / "strata-trace1.jsonl" };
  auto const path2{ std::filesystem::temp_directory_path() / "strata-trace2.jsonl" };

  CHECK_THROWS_AS(strata::tui::configure_trace_outputs(
                      { { strata::tui::trace_output_type::file, path1 },
                        { strata::tui::trace_output_type::file, path2 } }),
                  std::logic_error);

  strata::tui::configure_trace_outputs({});
  std::error_code ec;
  std::filesystem::remove(path1, ec);
  std::filesystem::remove(path2, ec);
}

TEST_CASE_FIXTURE(captured_output, "trace file output writes JSONL") {
  auto const trace_path{ std::filesystem::temp_directory_path() /
                         "strata_test_trace.jsonl" };
  std::error_code ec;
  std::filesystem::remove(trace_path, ec);

  strata::tui::configure_trace_outputs(
      { { strata::tui::trace_output_type::std_err, std::nullopt },
        { strata::tui::trace_output_type::file, trace_path } });
  CHECK_NOTHROW(strata::tui::run(strata::tui::level::TUI_TRACE, false));

  STRATA_TRACE_COMMAND_COMPLETE("zlib", "make", 2, 15);
  STRATA_TRACE_LEVEL_LOADED("3", "2", "/levels/3.lua");

  CHECK_NOTHROW(strata::tui::shutdown());

  auto const lines{ read_lines(trace_path) };
  REQUIRE(lines.size() == 2);
  for (auto const &json_line : lines) {
    CHECK(json_line.front() == '{');
    CHECK(json_line.back() == '}');
    CHECK(json_line.find("\"ts\":\"") != std::string::npos);
  }
  CHECK(lines[0].find("\"event\":\"command_complete\"") != std::string::npos);
  CHECK(lines[0].find("\"exit_code\":2") != std::string::npos);
  CHECK(lines[1].find("\"origin\":\"/levels/3.lua\"") != std::string::npos);

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("command_complete") != std::string::npos);

  std::filesystem::remove(trace_path, ec);
  strata::tui::configure_trace_outputs({});
}
