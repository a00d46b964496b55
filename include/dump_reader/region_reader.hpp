#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "dump_reader/statement_reader.hpp"

namespace dr {

// A StatementReader clamped to the region [offset, offset + size).
// Each region reader owns its own handle; concurrent regions share nothing.
class RegionReader {
public:
  RegionReader(std::string path, std::int64_t offset, std::int64_t size,
               StatementReader::Config cfg, LogSink log,
               MetricsRegistry* metrics = nullptr);

  Status open();

  // Read at most `max_block_size` bytes of the remaining region.
  Status read(std::int64_t max_block_size, std::vector<std::string>& out);

  // Underlying position, clamped to offset + size.
  std::int64_t tell() const noexcept { return pos_; }
  void seek(std::int64_t pos);

  std::int64_t offset() const noexcept { return offset_; }
  std::int64_t size() const noexcept { return size_; }

  bool close();

  const StatementReader& file_reader() const noexcept { return reader_; }
  const std::string& error() const noexcept { return reader_.error(); }

private:
  StatementReader reader_;
  LogSink log_;
  std::int64_t offset_;
  std::int64_t size_;
  std::int64_t pos_;
};

}
