#include "util.h"

#include <system_error>
#include <utility>

namespace strata {

namespace {

constexpr char kTruncatedMarker[]{ "... (truncated)\n" };

}  // namespace

std::vector<std::string> util_split_words(std::string_view text) {
  std::vector<std::string> words;
  constexpr std::string_view kSeparators{ " \t\r\n" };

  std::size_t pos{ text.find_first_not_of(kSeparators) };
  while (pos != std::string_view::npos) {
    std::size_t const end{ text.find_first_of(kSeparators, pos) };
    words.emplace_back(text.substr(pos, end == std::string_view::npos ? end : end - pos));
    if (end == std::string_view::npos) { break; }
    pos = text.find_first_not_of(kSeparators, end);
  }

  return words;
}

std::string util_join_argv(std::vector<std::string> const &argv) {
  std::string out;
  for (auto const &arg : argv) {
    if (!out.empty()) { out.push_back(' '); }
    if (arg.empty() || arg.find_first_of(" \t\n") != std::string::npos) {
      out.push_back('\'');
      out.append(arg);
      out.push_back('\'');
    } else {
      out.append(arg);
    }
  }
  return out;
}

std::string util_tail(std::string const &text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) { return text; }
  return kTruncatedMarker + text.substr(text.size() - max_bytes);
}

void util_tail_buffer::append(std::string_view text) {
  text_ += text;
  if (text_.size() > 2 * max_bytes_) {
    text_.erase(0, text_.size() - max_bytes_);
    dropped_ = true;
  }
}

std::string util_tail_buffer::str() const {
  if (!dropped_) { return util_tail(text_, max_bytes_); }
  return kTruncatedMarker + text_.substr(text_.size() - max_bytes_);
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace strata
