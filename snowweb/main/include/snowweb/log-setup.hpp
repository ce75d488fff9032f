#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "snowweb/log.hpp"

namespace snowweb {

enum class LogSink : std::uint8_t { Stderr, Stdout, Syslog };

[[nodiscard]] std::optional<LogSink> ParseLogSink(std::string_view name) noexcept;

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off").
[[nodiscard]] std::optional<log::level::level_enum> ParseLogLevel(std::string_view name);

// Replaces the default logger by one named "snowweb" writing to 'sink'.
// The syslog sink uses ident "snowweb" and facility LOG_DAEMON, the stderr one is colored when stderr is a terminal.
void SetupLogging(LogSink sink, log::level::level_enum level);

}  // namespace snowweb
