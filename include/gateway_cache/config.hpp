#pragma once

#include <cstddef>
#include <string>

namespace gateway_cache {

struct CacheConfig {
  std::size_t dm_channel_capacity{100};
  std::size_t message_capacity{1000};
  std::string log_level{"warn"};
  std::string log_pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
};

// Reads a flat JSON object such as
//   {"dm_channel_capacity":50,"message_capacity":5000,"log_level":"debug"}
// into out. Fields that are absent keep their current value; numeric fields
// are clamped. On failure out is left untouched.
bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err = nullptr);

bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err = nullptr);

} // namespace gateway_cache
