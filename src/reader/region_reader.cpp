#include "dump_reader/region_reader.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace dr {

// A region that is all annotation skips to content beyond its end; report the end.
static std::int64_t clamp_to(std::int64_t pos, std::int64_t end) {
  return pos < 0 ? pos : std::min(pos, end);
}

// offset + size, saturating for "rest of file" sizes.
static std::int64_t region_end(std::int64_t offset, std::int64_t size) {
  if (size > std::numeric_limits<std::int64_t>::max() - offset)
    return std::numeric_limits<std::int64_t>::max();
  return offset + size;
}

RegionReader::RegionReader(std::string path, std::int64_t offset, std::int64_t size,
                           StatementReader::Config cfg, LogSink log,
                           MetricsRegistry* metrics)
  : reader_(std::move(path), cfg, log, metrics),
    log_(std::move(log)),
    offset_(offset),
    size_(size),
    pos_(offset) {}

Status RegionReader::open() {
  log_(LogLevel::Debug, "[" + reader_.path() + "] offset = " + std::to_string(offset_) +
                        " / size = " + std::to_string(size_));
  Status st = reader_.open(offset_);
  if (st == Status::Ok) pos_ = clamp_to(reader_.tell(), region_end(offset_, size_));
  return st;
}

Status RegionReader::read(std::int64_t max_block_size, std::vector<std::string>& out) {
  const std::int64_t end = region_end(offset_, size_);
  if (pos_ >= end) return Status::EndOfFile;

  const std::int64_t read_size = std::min(max_block_size, end - pos_);
  Status st = reader_.read(read_size, out);
  pos_ = clamp_to(reader_.tell(), end);
  return st;
}

void RegionReader::seek(std::int64_t pos) { pos_ = clamp_to(reader_.seek(pos), region_end(offset_, size_)); }

bool RegionReader::close() { return reader_.close(); }

}
