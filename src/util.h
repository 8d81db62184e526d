#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Split on runs of spaces, tabs and newlines. No quoting rules: "-j4  -l8" -> {"-j4",
// "-l8"}. Mirrors how MAKEOPTS / EXTRA_ECONF style variables are word-split.
std::vector<std::string> util_split_words(std::string_view text);

// Join argv for display, quoting words that contain whitespace.
std::string util_join_argv(std::vector<std::string> const &argv);

// Keep only the last `max_bytes` of `text`, prefixed with a truncation marker.
std::string util_tail(std::string const &text, std::size_t max_bytes);

// Streaming util_tail: holds at most 2 * max_bytes while text is appended.
class util_tail_buffer {
 public:
  explicit util_tail_buffer(std::size_t max_bytes) : max_bytes_{ max_bytes } {}

  void append(std::string_view text);
  std::string str() const;
  std::size_t retained() const { return text_.size(); }

 private:
  std::size_t max_bytes_;
  std::string text_;
  bool dropped_{ false };
};

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace strata
