#include "dump_reader/header_detector.hpp"
#include "dump_reader/line_buffer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <regex>
#include <utility>

namespace dr {

// Bounds the regex input; the header itself is a few dozen bytes, rows can be huge.
static constexpr std::size_t kHeaderWindow = 4096;

static std::size_t find_icase(std::string_view s, std::string_view needle) {
  auto it = std::search(s.begin(), s.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) ==
                                 std::toupper(static_cast<unsigned char>(b));
                        });
  return it == s.end() ? std::string_view::npos
                       : static_cast<std::size_t>(it - s.begin());
}

std::optional<std::string> match_insert_header(std::string_view line) {
  static const std::regex re("INSERT INTO .* VALUES",
                             std::regex::ECMAScript | std::regex::icase);

  std::size_t at = find_icase(line, "INSERT INTO ");
  if (at == std::string_view::npos) return std::nullopt;
  std::string_view window = line.substr(at, kHeaderWindow);

  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(window.begin(), window.end(), m, re)) return std::nullopt;
  return m.str(0);
}

std::string detect_insert_header(const std::string& path,
                                 std::size_t block_bytes,
                                 const LogSink& log) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    log(LogLevel::Error, "open file failed (" + path + ") : " + std::strerror(errno));
    return {};
  }

  LineBuffer lb(block_bytes);
  std::string line;
  std::string header;
  while (true) {
    line.clear();
    bool io_error = false;
    if (lb.read_line(f, line, io_error, kHeaderWindow * 4) == 0) {
      if (io_error) log(LogLevel::Error, "read file failed (" + path + ")");
      break;
    }
    if (auto h = match_insert_header(line)) {
      header = std::move(*h);
      break;
    }
  }
  std::fclose(f);
  return header;
}

}
