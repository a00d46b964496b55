#pragma once
#include <string_view>

namespace dr {

// Outcome of a reader or decoder call. EndOfFile is a normal stop, not a failure.
enum class Status {
  Ok,
  EndOfFile,
  HeaderNotFound,
  IoError,
  InvalidEncoding,
  UnsupportedEncoding
};

std::string_view status_name(Status s) noexcept;

inline bool is_fatal(Status s) noexcept {
  return s != Status::Ok && s != Status::EndOfFile;
}

}
