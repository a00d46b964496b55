#include "dump_reader/log.hpp"
#include "dump_reader/status.hpp"
#include <iostream>
#include <mutex>

namespace dr {

std::string_view level_name(LogLevel lv) noexcept {
  switch (lv) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

std::string_view status_name(Status s) noexcept {
  switch (s) {
    case Status::Ok:                  return "ok";
    case Status::EndOfFile:           return "end of file";
    case Status::HeaderNotFound:      return "insert statement not found";
    case Status::IoError:             return "i/o error";
    case Status::InvalidEncoding:     return "invalid schema encoding";
    case Status::UnsupportedEncoding: return "unsupported encoding";
  }
  return "unknown";
}

LogSink default_log_sink(bool verbose) {
  return [verbose](LogLevel lv, std::string_view msg) {
    if (lv == LogLevel::Debug && !verbose) return;
    // one write per line so concurrent workers don't interleave mid-line
    static std::mutex mu;
    std::string line = "[dump] ";
    line += level_name(lv);
    line += ": ";
    line += msg;
    line += '\n';
    std::lock_guard<std::mutex> lk(mu);
    std::cerr << line;
  };
}

LogSink null_log_sink() {
  return [](LogLevel, std::string_view) {};
}

}
