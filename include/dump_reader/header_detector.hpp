#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "dump_reader/log.hpp"

namespace dr {

// Case-insensitive `INSERT INTO <anything> VALUES` match on one line.
// Returns the exact matched text.
std::optional<std::string> match_insert_header(std::string_view line);

// Probe `path` line by line (fresh handle, `block_bytes` look-ahead) and
// return the header of the first matching line. Empty when the file has none
// or cannot be opened (the failure is logged).
std::string detect_insert_header(const std::string& path,
                                 std::size_t block_bytes,
                                 const LogSink& log);

}
