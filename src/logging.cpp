/*
  Logging — process-wide level and sink.

  The default sink prints "[bigraph:<level>] <message>" lines to stderr.
  The library is single-threaded; the level and sink are plain globals.
*/
#include "bigraph/core/logging.hpp"

#include <cstdio>

#include <fmt/format.h>

namespace bigraph::core {

namespace {
LogLevel g_level = LogLevel::Warn;

LogSink& sink_slot() {
  static LogSink sink;
  return sink;
}

void default_sink(LogLevel level, std::string_view message) {
  fmt::print(stderr, "[bigraph:{}] {}\n", to_string(level), message);
}
} // namespace

void set_log_level(LogLevel level) noexcept { g_level = level; }

LogLevel log_level() noexcept { return g_level; }

bool log_enabled(LogLevel level) noexcept {
  return level != LogLevel::Off && static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(g_level);
}

void set_log_sink(LogSink sink) { sink_slot() = std::move(sink); }

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Off: return "off";
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    case LogLevel::Trace: return "trace";
  }
  return "unknown";
}

namespace detail {
void emit(LogLevel level, std::string_view message) {
  auto& sink = sink_slot();
  if (sink) {
    sink(level, message);
  } else {
    default_sink(level, message);
  }
}
} // namespace detail

} // namespace bigraph::core
