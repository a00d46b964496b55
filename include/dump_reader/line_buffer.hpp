#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace dr {

// Grow-only look-ahead buffer over a FILE*. The capacity never shrinks, so a
// later call with a smaller budget reuses the same storage; reset() only
// drops the buffered view.
class LineBuffer {
public:
  explicit LineBuffer(std::size_t cap_bytes = 0);

  // Grow capacity to at least `n` bytes. Drops any buffered bytes.
  void reserve(std::size_t n);

  // Forget buffered look-ahead; the next read starts at the handle's position.
  void reset() noexcept;

  // Append the next line (including its '\n', if any) to `line`.
  // Returns the number of source bytes consumed; 0 means EOF. A line longer
  // than the capacity is assembled across refills. With a non-zero `limit`
  // at most `limit` bytes are kept (the rest of the line is still consumed)
  // and `*truncated` is set. Sets `io_error` on fread failure.
  std::size_t read_line(std::FILE* f, std::string& line, bool& io_error,
                        std::size_t limit = 0, bool* truncated = nullptr);

  std::size_t capacity() const noexcept { return buf_.size(); }
  std::size_t buffered() const noexcept { return tail_ - head_; }
  std::uint64_t refills() const noexcept { return refills_; }

private:
  bool fill(std::FILE* f, bool& io_error);

  std::vector<char> buf_;
  std::size_t head_{0};
  std::size_t tail_{0};
  std::uint64_t refills_{0};
};

}
