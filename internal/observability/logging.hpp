#pragma once

#include <spdlog/common.h>

#include <initializer_list>
#include <string>
#include <string_view>

namespace claimctl::runtime::config {
class RuntimeConfig;
}

namespace claimctl::observability {

// One key=value pair appended to a log line. Values with spaces are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "claimctl" logger as spdlog's default.

  Writes to stderr; stdout only ever carries printed claims.
  Level and pattern: $CLAIMCTL_LOG_LEVEL / $CLAIMCTL_LOG_PATTERN, then the
  config file, then "warn" and an ISO-8601 pattern.

  Throws std::invalid_argument on an unknown level name.
*/
void InitializeLogging(const claimctl::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Before InitializeLogging() runs, logs go to a stderr "claimctl" logger at warn.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace claimctl::observability

#define CLAIMCTL_LOG_DEBUG(message, ...) ::claimctl::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define CLAIMCTL_LOG_INFO(message, ...) ::claimctl::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
