#include "snowweb/log-setup.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "snowweb/log.hpp"

namespace snowweb {

std::optional<LogSink> ParseLogSink(std::string_view name) noexcept {
  if (name == "stderr") {
    return LogSink::Stderr;
  }
  if (name == "stdout") {
    return LogSink::Stdout;
  }
  if (name == "syslog") {
    return LogSink::Syslog;
  }
  return std::nullopt;
}

std::optional<log::level::level_enum> ParseLogLevel(std::string_view name) {
  const auto level = log::level::from_str(std::string(name));
  if (level == log::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

void SetupLogging(LogSink sink, log::level::level_enum level) {
  log::sink_ptr sinkPtr;
  switch (sink) {
    case LogSink::Stdout:
      sinkPtr = std::make_shared<log::sinks::stdout_sink_mt>();
      break;
    case LogSink::Syslog:
      // syslog adds its own timestamp and ident
      sinkPtr = std::make_shared<log::sinks::syslog_sink_mt>("snowweb", LOG_PID, LOG_DAEMON, false);
      break;
    default:
      sinkPtr = std::make_shared<log::sinks::stderr_color_sink_mt>();
      break;
  }
  auto logger = std::make_shared<log::logger>("snowweb", std::move(sinkPtr));
  if (sink == LogSink::Syslog) {
    logger->set_pattern("%v");
  }
  logger->set_level(level);
  logger->flush_on(log::level::warn);
  log::set_default_logger(std::move(logger));
}

}  // namespace snowweb
