#include "dump_reader/statement_reader.hpp"
#include "dump_reader/header_detector.hpp"
#include "dump_reader/line_buffer.hpp"
#include "dump_reader/metrics.hpp"
#include "dump_reader/statement.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <new>
#include <string_view>
#include <system_error>
#include <utility>
#include <sys/types.h>

namespace dr {

struct StatementReader::Impl {
  std::string path;
  Config cfg;
  LogSink log;
  MetricsRegistry* metrics{nullptr};

  std::FILE* fd{nullptr};
  std::int64_t fsize{0};
  std::int64_t start{0};
  std::string header;

  // grow-only; its capacity is the reader's buffer size
  LineBuffer buffer;

  std::string err;
  int last_errno{0};

  Impl(std::string p, Config c, LogSink l, MetricsRegistry* m)
    : path(std::move(p)), cfg(c), log(std::move(l)), metrics(m) {}

  Status fail_io(const char* what) {
    last_errno = errno;
    err = std::string(what) + " (" + path + ") : " + std::strerror(last_errno);
    return Status::IoError;
  }

  std::int64_t tell() const {
    if (!fd) return -1;
    off_t off = ::ftello(fd);
    if (off < 0) {
      log(LogLevel::Error, "get file offset failed (" + path + ") : " + std::strerror(errno));
      return -1;
    }
    return static_cast<std::int64_t>(off);
  }

  bool seek_to(std::int64_t pos) {
    if (::fseeko(fd, static_cast<off_t>(pos), SEEK_SET) != 0) {
      fail_io("seek failed");
      log(LogLevel::Error, err);
      return false;
    }
    return true;
  }

  // Start of the physical line holding `offset`; -1 on a read failure.
  std::int64_t line_start(std::int64_t offset) {
    char block[4096];
    std::int64_t pos = offset;
    while (pos > 0) {
      const std::int64_t from = std::max<std::int64_t>(0, pos - static_cast<std::int64_t>(sizeof block));
      const auto len = static_cast<std::size_t>(pos - from);
      if (!seek_to(from)) return -1;
      if (std::fread(block, 1, len, fd) != len) {
        fail_io("read failed");
        log(LogLevel::Error, err);
        return -1;
      }
      for (std::size_t i = len; i > 0; --i)
        if (block[i - 1] == '\n') return from + static_cast<std::int64_t>(i);
      pos = from;
    }
    return 0;
  }

  // Move the handle from `offset` past any `/* ... */;` lines. When `offset`
  // falls inside a line, the rest of that line is skipped if the whole line
  // is an annotation or the part after `offset` ends like one, so a region
  // starting mid-comment lands on real content.
  std::int64_t skip_annotation(std::int64_t offset) {
    if (offset >= fsize) {
      (void)seek_to(fsize);
      return tell();
    }

    const std::int64_t ls = line_start(offset);
    if (ls < 0) {
      (void)seek_to(offset);
      return tell();
    }
    if (!seek_to(ls)) return tell();

    buffer.reserve(cfg.read_block_bytes);
    std::int64_t skip = 0;
    std::string line;
    bool done = false;

    if (ls < offset) {
      bool io_error = false;
      std::size_t n = buffer.read_line(fd, line, io_error);
      if (io_error) {
        fail_io("read failed");
        log(LogLevel::Error, err);
        done = true;
      } else {
        // the line runs from ls through a '\n' at or after offset (or EOF)
        const std::string_view whole = trim(line);
        const std::string_view rest =
            trim(std::string_view(line).substr(static_cast<std::size_t>(offset - ls)));
        const bool comment_tail = rest.size() >= 3 &&
                                  rest.compare(rest.size() - 3, 3, "*/;") == 0;
        if (is_annotation_block(whole) || comment_tail)
          skip = ls + static_cast<std::int64_t>(n) - offset;
        else
          done = true;
      }
    }

    while (!done) {
      line.clear();
      bool io_error = false;
      std::size_t n = buffer.read_line(fd, line, io_error);
      if (io_error) {
        fail_io("read failed");
        log(LogLevel::Error, err);
        break;
      }
      if (n == 0) break; // EOF: skip now covers everything after offset
      if (!is_annotation_block(trim(line))) break;
      skip += static_cast<std::int64_t>(n);
    }
    buffer.reset();

    // seeking beyond EOF is not an error but would make tell() lie
    (void)seek_to(std::min(offset + skip, fsize));
    return tell();
  }

  // Rows of each emitted statement are recorded in `emitted` and only reach
  // the metrics once the whole read succeeds.
  void emit(std::string& sql, std::uint64_t rows, std::vector<std::string>& out,
            std::vector<std::uint64_t>& emitted) {
    switch (finalize_statement(sql, header)) {
      case StatementCheck::Ok:
        emitted.push_back(rows);
        out.push_back(std::move(sql));
        break;
      case StatementCheck::Empty:
        break;
      case StatementCheck::BadStart:
        log(LogLevel::Error, "Unexpected statement start : '" +
                             std::string(head_excerpt(sql)) + " ..'");
        if (metrics) metrics->add_anomaly("bad_start");
        break;
      case StatementCheck::BadEnd:
        log(LogLevel::Error, "Unexpected statement end : '.. " +
                             std::string(tail_excerpt(sql)) + "'");
        if (metrics) metrics->add_anomaly("bad_end");
        break;
    }
    sql.clear();
  }

  Status read(std::int64_t min_size, std::vector<std::string>& out) {
    if (!fd) {
      err = "reader is closed (" + path + ")";
      return Status::IoError;
    }
    const std::int64_t begin = tell();
    if (begin < 0) return fail_io("get file offset failed");
    if (begin >= fsize) return Status::EndOfFile;
    if (min_size < 1) min_size = 1;

    // the loop stops at EOF, so nothing past the file needs buffering
    const std::int64_t budget = std::min(min_size, fsize - begin);
    try {
      buffer.reserve(static_cast<std::size_t>(budget) * 2);
    } catch (const std::bad_alloc&) {
      // rows are still assembled across refills of the current buffer
      log(LogLevel::Warn, "cannot grow read buffer to " + std::to_string(budget * 2) +
                          " bytes for " + path + "; keeping " +
                          std::to_string(buffer.capacity()));
      buffer.reset();
    }
    const std::size_t out_mark = out.size();

    /*
      Rows arrive one per line:
        INSERT INTO xxx VALUES
        (...),
        (...);
      A batch not starting with the header gets one prepended.
    */
    std::string statement;
    std::vector<std::uint64_t> emitted;
    std::uint64_t rows = 0;
    std::int64_t read_size = 0;
    std::string line;
    while (true) {
      line.clear();
      bool io_error = false, truncated = false;
      std::size_t n = buffer.read_line(fd, line, io_error, cfg.max_row_bytes, &truncated);
      if (io_error) {
        // leave the call without effect: nothing emitted, handle back at begin
        Status st = fail_io("read failed");
        log(LogLevel::Error, err);
        buffer.reset();
        out.resize(out_mark);
        (void)seek_to(begin);
        return st;
      }
      if (n == 0) break;
      read_size += static_cast<std::int64_t>(n);

      std::string_view t = trim(line);
      if (truncated) {
        log(LogLevel::Warn, "Oversize row dropped at offset " +
                            std::to_string(begin + read_size - static_cast<std::int64_t>(n)) +
                            " (" + std::to_string(n) + " bytes) in " + path);
        if (metrics) metrics->add_anomaly("oversize_row");
      } else if (!t.empty() && !is_comment_line(t)) {
        const bool has_header = t.compare(0, header.size(), header) == 0;
        if (statement.empty() && !has_header) statement += header;
        statement.append(t.data(), t.size());
        rows += count_rows(has_header ? t.substr(header.size()) : t);

        if (statement.back() == ';') {
          emit(statement, rows, out, emitted);
          rows = 0;
        }
      }

      if (read_size >= min_size) break;
    }
    buffer.reset();

    // the look-ahead went past what was consumed; put the handle back
    if (!seek_to(begin + read_size)) {
      out.resize(out_mark);
      return Status::IoError;
    }
    if (!statement.empty()) emit(statement, rows, out, emitted);
    if (metrics) {
      metrics->add_bytes(static_cast<std::uint64_t>(read_size));
      for (std::uint64_t r : emitted) metrics->add_statement(r);
    }
    return Status::Ok;
  }

  bool close() {
    bool ok = true;
    if (fd) {
      if (std::fclose(fd) != 0) {
        fail_io("close failed");
        ok = false;
      }
      fd = nullptr;
    }
    buffer = LineBuffer();
    return ok;
  }
};

StatementReader::StatementReader(std::string path, Config cfg, LogSink log,
                                 MetricsRegistry* metrics)
  : p_(new Impl(std::move(path), cfg, std::move(log), metrics)) {}

StatementReader::~StatementReader() {
  p_->close();
  delete p_;
}

Status StatementReader::open(std::int64_t offset) {
  p_->close();
  p_->err.clear();

  p_->fd = std::fopen(p_->path.c_str(), "rb");
  if (!p_->fd) return p_->fail_io("open file failed");

  if (::fseeko(p_->fd, static_cast<off_t>(offset), SEEK_SET) != 0) {
    Status st = p_->fail_io("seek failed");
    p_->close();
    return st;
  }

  std::error_code ec;
  auto sz = std::filesystem::file_size(p_->path, ec);
  if (ec) {
    p_->last_errno = ec.value();
    p_->err = "stat failed (" + p_->path + ") : " + ec.message();
    p_->close();
    return Status::IoError;
  }
  p_->fsize = static_cast<std::int64_t>(sz);
  p_->start = offset;

  p_->header = detect_insert_header(p_->path, p_->cfg.read_block_bytes, p_->log);
  if (p_->header.empty()) {
    p_->err = "insert statement not found (" + p_->path + ")";
    p_->close();
    return Status::HeaderNotFound;
  }

  if (p_->skip_annotation(offset) < 0 || !p_->err.empty()) {
    p_->close();
    return Status::IoError;
  }
  return Status::Ok;
}

Status StatementReader::read(std::int64_t min_size, std::vector<std::string>& out) {
  return p_->read(min_size, out);
}

std::int64_t StatementReader::seek(std::int64_t offset) {
  if (!p_->fd) return -1;
  return p_->skip_annotation(offset);
}

std::int64_t StatementReader::tell() const { return p_->tell(); }
bool StatementReader::close() { return p_->close(); }

const std::string& StatementReader::path() const noexcept { return p_->path; }
const std::string& StatementReader::header() const noexcept { return p_->header; }
std::int64_t StatementReader::file_size() const noexcept { return p_->fsize; }
std::size_t StatementReader::buffer_capacity() const noexcept { return p_->buffer.capacity(); }
const std::string& StatementReader::error() const noexcept { return p_->err; }
int StatementReader::last_error() const noexcept { return p_->last_errno; }

}
