#include "gateway_cache/logging.hpp"

#include "gateway_cache/config.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gateway_cache {
namespace {

constexpr const char *kLoggerName = "gateway-cache";

std::string resolve_level(const CacheConfig &config) {
  if (const char *level = std::getenv("GATEWAY_CACHE_LOG_LEVEL"))
    return level;
  if (!config.log_level.empty())
    return config.log_level;
  return "warn";
}

std::string resolve_pattern(const CacheConfig &config) {
  if (const char *pattern = std::getenv("GATEWAY_CACHE_LOG_PATTERN"))
    return pattern;
  if (!config.log_pattern.empty())
    return config.log_pattern;
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto &field : fields) {
    if (!first)
      out << ' ';
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

std::shared_ptr<spdlog::logger> cache_logger() {
  if (auto logger = spdlog::get(kLoggerName))
    return logger;
  return spdlog::default_logger();
}

} // namespace

LogField string_field(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField id_field(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void init_logging(const CacheConfig &config) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(resolve_pattern(config));
  logger->set_level(spdlog::level::from_str(resolve_level(config)));
  logger->flush_on(spdlog::level::warn);
}

void shutdown_logging() { spdlog::drop(kLoggerName); }

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  auto logger = cache_logger();
  if (!logger->should_log(level))
    return;
  auto serialized = serialize_fields(fields);
  if (serialized.empty()) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, serialized);
}

} // namespace gateway_cache
