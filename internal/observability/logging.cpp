#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace claimctl::observability {
namespace {

constexpr const char* kLoggerName     = "claimctl";
constexpr const char* kDefaultLevel   = "warn";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment beats the config file; empty values count as unset.
std::string FirstSet(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* env = std::getenv(env_name); env && *env != '\0') {
    return env;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  // from_str() maps unknown names to "off"; a typo must not silence the CLI.
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level \"" + name + "\"");
  }
  return level;
}

bool NeedsQuotes(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) {
    out += ' ';
  }
  out += field.key;
  out += '=';
  if (!NeedsQuotes(field.value)) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
}

std::shared_ptr<spdlog::logger> MakeLogger(spdlog::level::level_enum level, const std::string& pattern) {
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

std::mutex g_logger_mutex;

// The "claimctl" logger, created with defaults when InitializeLogging() has not
// run. spdlog's own default logger writes to stdout and is never used.
std::shared_ptr<spdlog::logger> Logger() {
  if (auto logger = spdlog::get(kLoggerName)) {
    return logger;
  }

  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (auto logger = spdlog::get(kLoggerName)) {
    return logger;
  }
  return MakeLogger(ParseLevel(kDefaultLevel), kDefaultPattern);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const claimctl::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(FirstSet("CLAIMCTL_LOG_LEVEL", config.logging().level(), kDefaultLevel));
  const auto pattern = FirstSet("CLAIMCTL_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  // Re-initialization replaces the logger rather than failing on the name.
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(MakeLogger(level, pattern));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = Logger();
  if (!logger->should_log(level)) {
    return;
  }

  std::string rendered;
  for (const auto& field : fields) {
    AppendField(rendered, field);
  }

  if (rendered.empty()) {
    logger->log(level, "{}", message);
  } else {
    logger->log(level, "{} {}", message, rendered);
  }
}

} // namespace claimctl::observability
