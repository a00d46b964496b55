#include "dump_reader/encoding.hpp"
#include "dump_reader/statement.hpp"

#include <simdjson.h>
#include <iconv.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

namespace dr {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD"; // U+FFFD in UTF-8

struct IconvHandle {
  iconv_t cd;
  explicit IconvHandle(iconv_t c) : cd(c) {}
  ~IconvHandle() { if (cd != (iconv_t)-1) iconv_close(cd); }
  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;
};

void set_err(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
}

// GB18030 -> UTF-8. Illegal or truncated input is reported, never replaced.
Status decode_gb18030(std::string_view data, std::string& out, std::string* err) {
  IconvHandle h(iconv_open("UTF-8", "GB18030"));
  if (h.cd == (iconv_t)-1) {
    set_err(err, std::string("iconv cannot convert from GB18030: ") + std::strerror(errno));
    return Status::UnsupportedEncoding;
  }

  std::string in(data);
  std::string buf(in.size() * 2 + 16, '\0');
  char* inptr = in.empty() ? nullptr : &in[0];
  std::size_t inleft = in.size();
  std::size_t written = 0;

  while (inleft > 0) {
    char* outptr = &buf[written];
    std::size_t outleft = buf.size() - written;
    std::size_t rc = iconv(h.cd, &inptr, &inleft, &outptr, &outleft);
    written = buf.size() - outleft;
    if (rc != (std::size_t)-1) break;
    if (errno == E2BIG) {
      buf.resize(buf.size() * 2);
      continue;
    }
    // EILSEQ: illegal sequence; EINVAL: sequence cut off at end of input
    set_err(err, "invalid GB18030 sequence at byte " +
                 std::to_string(in.size() - inleft));
    return Status::InvalidEncoding;
  }

  // flush shift state (no-op for GB18030, kept for completeness of the iconv protocol)
  for (;;) {
    char* outptr = &buf[written];
    std::size_t outleft = buf.size() - written;
    std::size_t rc = iconv(h.cd, nullptr, nullptr, &outptr, &outleft);
    written = buf.size() - outleft;
    if (rc != (std::size_t)-1) break;
    if (errno != E2BIG) {
      set_err(err, std::string("iconv flush failed: ") + std::strerror(errno));
      return Status::InvalidEncoding;
    }
    buf.resize(buf.size() * 2);
  }
  buf.resize(written);

  if (buf.find(kReplacementChar) != std::string::npos) {
    set_err(err, "decoded text contains U+FFFD");
    return Status::InvalidEncoding;
  }
  out = std::move(buf);
  return Status::Ok;
}

}

bool is_valid_utf8(std::string_view data) noexcept {
  return simdjson::validate_utf8(data.data(), data.size());
}

Status normalize_encoding(std::string_view data,
                          std::string_view charset,
                          std::string& out,
                          std::string* err) {
  if (charset == "binary") {
    out.assign(data.data(), data.size());
    return Status::Ok;
  }
  if (charset == "auto" || charset == "utf8mb4") {
    if (is_valid_utf8(data)) {
      out.assign(data.data(), data.size());
      return Status::Ok;
    }
    if (charset == "utf8mb4") {
      set_err(err, "input is not valid UTF-8");
      return Status::InvalidEncoding;
    }
    // "auto": GB18030 is the only other supported encoding
    return decode_gb18030(data, out, err);
  }
  if (charset == "gb18030") {
    return decode_gb18030(data, out, err);
  }
  set_err(err, "Unsupported encoding " + std::string(charset));
  return Status::UnsupportedEncoding;
}

Status load_schema_statement(const std::string& path,
                             std::string_view charset,
                             std::string& out,
                             const LogSink& log,
                             std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    set_err(err, "open failed: " + path + ": " + std::strerror(errno));
    return Status::IoError;
  }

  std::string data;
  std::string buffer;
  std::string raw;
  while (std::getline(in, raw)) {
    std::string_view line = trim(raw);
    if (line.empty()) continue;

    buffer.append(line.data(), line.size());
    if (buffer.back() == ';') {
      if (!is_annotation_block(buffer)) data += buffer;
      buffer.clear();
    } else {
      buffer.push_back('\n');
    }
  }
  if (in.bad()) {
    set_err(err, "read failed: " + path);
    return Status::IoError;
  }

  std::string decode_err;
  Status st = normalize_encoding(data, charset, out, &decode_err);
  if (st != Status::Ok) {
    log(LogLevel::Error, "cannot decode input file as " + std::string(charset) +
                         " encoding, please convert it manually: " + path);
    set_err(err, "failed to decode " + path + " as " + std::string(charset) +
                 ": " + decode_err);
  }
  return st;
}

}
