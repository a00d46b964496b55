#include "dump_reader/line_buffer.hpp"
#include <algorithm>
#include <cstring>

namespace dr {

static constexpr std::size_t kDefaultCapacity = 64 * 1024;

LineBuffer::LineBuffer(std::size_t cap_bytes) : buf_(cap_bytes) {}

void LineBuffer::reserve(std::size_t n) {
  if (n > buf_.size()) {
    std::size_t grow = std::max(n, buf_.size() + buf_.size() / 2 + 1);
    buf_.resize(grow);
  }
  reset();
}

void LineBuffer::reset() noexcept { head_ = tail_ = 0; }

bool LineBuffer::fill(std::FILE* f, bool& io_error) {
  if (buf_.empty()) buf_.resize(kDefaultCapacity);
  head_ = tail_ = 0;
  std::size_t n = std::fread(buf_.data(), 1, buf_.size(), f);
  ++refills_;
  if (n == 0) {
    if (std::ferror(f)) io_error = true;
    return false;
  }
  tail_ = n;
  return true;
}

std::size_t LineBuffer::read_line(std::FILE* f, std::string& line, bool& io_error,
                                  std::size_t limit, bool* truncated) {
  std::size_t consumed = 0;
  while (true) {
    if (head_ == tail_ && !fill(f, io_error)) return consumed;

    const char* b = buf_.data() + head_;
    const std::size_t avail = tail_ - head_;
    const void* nl = std::memchr(b, '\n', avail);
    const std::size_t n = nl ? static_cast<std::size_t>(static_cast<const char*>(nl) - b) + 1
                             : avail;

    // past the guard: keep consuming but stop copying
    std::size_t keep = n;
    if (limit != 0) {
      std::size_t room = line.size() < limit ? limit - line.size() : 0;
      if (n > room) {
        keep = room;
        if (truncated) *truncated = true;
      }
    }
    line.append(b, keep);
    head_ += n;
    consumed += n;
    if (nl) return consumed;
  }
}

}
