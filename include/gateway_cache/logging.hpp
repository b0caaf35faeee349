#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace gateway_cache {

struct CacheConfig;

struct LogField {
  std::string key;
  std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField id_field(std::string_view key, std::uint64_t value);
LogField int_field(std::string_view key, std::int64_t value);
LogField bool_field(std::string_view key, bool value);

void init_logging(const CacheConfig &config);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message,
                      std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message,
                     std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::warn, message, fields);
}

} // namespace gateway_cache

#define GATEWAY_CACHE_LOG_DEBUG(message, ...)                                  \
  ::gateway_cache::log_debug((message), ##__VA_ARGS__)
#define GATEWAY_CACHE_LOG_INFO(message, ...)                                   \
  ::gateway_cache::log_info((message), ##__VA_ARGS__)
#define GATEWAY_CACHE_LOG_WARN(message, ...)                                   \
  ::gateway_cache::log_warn((message), ##__VA_ARGS__)
