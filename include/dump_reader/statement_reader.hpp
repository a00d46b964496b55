#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dump_reader/log.hpp"
#include "dump_reader/status.hpp"

namespace dr {

class MetricsRegistry;

// Turns a byte window of a dump file into complete, independently executable
// INSERT statements. One instance owns one file handle.
//
// Dump layout:
//   /* ... */;                      <- annotation blocks, skipped
//   INSERT INTO `t` VALUES          <- header, found once per file
//   (...),
//   (...);
//
// Every emitted statement starts with the header and ends in ';'. A batch cut
// off by the byte budget is closed by rewriting its trailing ',' to ';'.
class StatementReader {
public:
  struct Config {
    std::size_t read_block_bytes = 64 * 1024; // look-ahead for header probe / annotation skip
    std::size_t max_row_bytes    = 0;         // 0 = unbounded; longer rows are dropped
  };

  StatementReader(std::string path, Config cfg, LogSink log,
                  MetricsRegistry* metrics = nullptr);
  ~StatementReader();

  StatementReader(const StatementReader&) = delete;
  StatementReader& operator=(const StatementReader&) = delete;

  // Open the file at `offset`, detect the header and skip annotation blocks.
  // HeaderNotFound when the file has no INSERT header; IoError on open/seek/stat.
  Status open(std::int64_t offset);

  // Consume at least `min_size` source bytes (finishing the last line) and
  // append the resulting statements to `out`. EndOfFile when the position is
  // already at or past the file size.
  Status read(std::int64_t min_size, std::vector<std::string>& out);

  // Reposition to `offset`, skip annotation blocks there, return the new position.
  std::int64_t seek(std::int64_t offset);

  // Exact offset of the next unread byte; -1 if the handle is closed or the query fails.
  std::int64_t tell() const;

  // Release the handle and the buffer. Safe to call more than once.
  bool close();

  const std::string& path() const noexcept;
  const std::string& header() const noexcept;
  std::int64_t file_size() const noexcept;
  std::size_t buffer_capacity() const noexcept;

  const std::string& error() const noexcept;
  int last_error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
