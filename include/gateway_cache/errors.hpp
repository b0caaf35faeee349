#pragma once

#include "gateway_cache/types.hpp"

#include <stdexcept>
#include <string>

namespace gateway_cache {

// Raised when a guild is known to the cache but the gateway has marked it
// unavailable (outage). Distinct from a plain miss, which is reported as an
// empty optional.
class UnavailableGuildError : public std::runtime_error {
public:
  explicit UnavailableGuildError(Snowflake guild_id)
      : std::runtime_error("guild " + std::to_string(guild_id) +
                           " is unavailable"),
        guild_id_(guild_id) {}

  Snowflake guild_id() const { return guild_id_; }

private:
  Snowflake guild_id_;
};

} // namespace gateway_cache
