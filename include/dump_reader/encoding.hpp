#pragma once
#include <string>
#include <string_view>

#include "dump_reader/log.hpp"
#include "dump_reader/status.hpp"

namespace dr {

// Validate / decode a schema text blob.
//   "binary"           -> copied as-is
//   "utf8mb4"          -> must be valid UTF-8, else InvalidEncoding
//   "auto"             -> UTF-8 if valid, otherwise tried as GB18030
//   "gb18030"          -> decoded to UTF-8; any U+FFFD in the result is InvalidEncoding
//   anything else      -> UnsupportedEncoding
Status normalize_encoding(std::string_view data,
                          std::string_view charset,
                          std::string& out,
                          std::string* err = nullptr);

// True when `data` is well-formed UTF-8.
bool is_valid_utf8(std::string_view data) noexcept;

// Read a schema file, drop blank lines and `/* ... */;` statements, join the
// remaining statements and normalize the result as `charset`.
Status load_schema_statement(const std::string& path,
                             std::string_view charset,
                             std::string& out,
                             const LogSink& log,
                             std::string* err = nullptr);

}
