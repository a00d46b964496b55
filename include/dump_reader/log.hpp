#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace dr {

enum class LogLevel { Debug, Info, Warn, Error };

// Injected into every component; nothing in the library logs through globals.
using LogSink = std::function<void(LogLevel, std::string_view)>;

// Writes "[dump] <level>: <msg>" to stderr. Debug lines only when verbose.
LogSink default_log_sink(bool verbose = false);

// Swallows everything (tests, benches).
LogSink null_log_sink();

std::string_view level_name(LogLevel lv) noexcept;

}
