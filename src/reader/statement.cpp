#include "dump_reader/statement.hpp"

namespace dr {

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

static bool starts_with(std::string_view s, std::string_view p) {
  return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

static bool ends_with(std::string_view s, std::string_view p) {
  return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

std::string_view trim(std::string_view s) noexcept {
  std::size_t b = 0, e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

bool is_annotation_block(std::string_view t) noexcept {
  return starts_with(t, "/*") && ends_with(t, "*/;");
}

// TODO: comments spanning several lines are treated as row content
bool is_comment_line(std::string_view t) noexcept {
  return starts_with(t, "/*") && (ends_with(t, "*/") || ends_with(t, "*/;"));
}

std::size_t count_rows(std::string_view v) noexcept {
  std::size_t rows = 0;
  int depth = 0;
  char quote = 0;
  for (std::size_t i = 0; i < v.size(); ++i) {
    const char c = v[i];
    if (quote) {
      if (c == '\\') ++i;
      else if (c == quote) quote = 0; // '' re-enters on the next quote
      continue;
    }
    switch (c) {
      case '\'': case '"': quote = c; break;
      case '(': if (depth++ == 0) ++rows; break;
      case ')': if (depth > 0) --depth; break;
      default: break;
    }
  }
  return rows;
}

StatementCheck finalize_statement(std::string& sql, std::string_view header) {
  std::string_view t = trim(sql);
  if (t.size() != sql.size()) sql = std::string(t);
  if (sql.empty()) return StatementCheck::Empty;

  if (!starts_with(sql, header)) return StatementCheck::BadStart;
  if (sql.size() == header.size()) return StatementCheck::Empty; // header without any values

  if (sql.back() != ';') {
    if (sql.back() != ',') return StatementCheck::BadEnd;
    sql.back() = ';';
  }
  return StatementCheck::Ok;
}

std::string_view head_excerpt(std::string_view s, std::size_t n) noexcept {
  return s.substr(0, n);
}

std::string_view tail_excerpt(std::string_view s, std::size_t n) noexcept {
  return s.size() > n ? s.substr(s.size() - n) : s;
}

}
