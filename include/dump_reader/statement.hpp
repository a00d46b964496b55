#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace dr {

// Trim ASCII whitespace (space, \t, \r, \n, \v, \f) on both ends.
std::string_view trim(std::string_view s) noexcept;

// `/* ... */;` on a single (trimmed) line: what annotation-skip steps over.
bool is_annotation_block(std::string_view trimmed_line) noexcept;

// Inline comment inside a statement body: `/* ... */` or `/* ... */;`.
bool is_comment_line(std::string_view trimmed_line) noexcept;

// Number of value tuples opened on one line: '(' at paren depth 0, outside
// quoted strings. "(1),(2)," counts 2; a continuation of a row counts 0.
std::size_t count_rows(std::string_view values) noexcept;

enum class StatementCheck { Ok, Empty, BadStart, BadEnd };

// Trim `sql`, check it begins with `header`, and make it end in ';' (a
// trailing ',' is rewritten). Only an Ok statement should be emitted.
StatementCheck finalize_statement(std::string& sql, std::string_view header);

// First / last `n` bytes of `s`, for log excerpts.
std::string_view head_excerpt(std::string_view s, std::size_t n = 10) noexcept;
std::string_view tail_excerpt(std::string_view s, std::size_t n = 10) noexcept;

}
