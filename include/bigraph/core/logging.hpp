/* Leveled diagnostics on top of {fmt}; process-wide level and sink. */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace bigraph::core {

enum class LogLevel : std::uint8_t {
  Off = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
  Debug = 4,
  Trace = 5
};

using LogSink = std::function<void(LogLevel, std::string_view)>;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;
[[nodiscard]] bool log_enabled(LogLevel level) noexcept;

// Replace the sink. An empty function restores the default stderr sink.
void set_log_sink(LogSink sink);

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

namespace detail {
void emit(LogLevel level, std::string_view message);

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
  if (!log_enabled(level)) return;
  emit(level, fmt::format(format, std::forward<Args>(args)...));
}
} // namespace detail

} // namespace bigraph::core

#define BIGRAPH_LOG_ERROR(...) ::bigraph::core::detail::log(::bigraph::core::LogLevel::Error, __VA_ARGS__)
#define BIGRAPH_LOG_WARN(...)  ::bigraph::core::detail::log(::bigraph::core::LogLevel::Warn, __VA_ARGS__)
#define BIGRAPH_LOG_INFO(...)  ::bigraph::core::detail::log(::bigraph::core::LogLevel::Info, __VA_ARGS__)
#define BIGRAPH_LOG_DEBUG(...) ::bigraph::core::detail::log(::bigraph::core::LogLevel::Debug, __VA_ARGS__)
#define BIGRAPH_LOG_TRACE(...) ::bigraph::core::detail::log(::bigraph::core::LogLevel::Trace, __VA_ARGS__)
