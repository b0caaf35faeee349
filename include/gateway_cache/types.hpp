#pragma once

#include <chrono>
#include <cstdint>

namespace gateway_cache {

using Snowflake = std::uint64_t;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class ChannelType : int {
  GuildText = 0,
  DM = 1,
  GuildVoice = 2,
  GroupDM = 3,
  GuildCategory = 4,
  GuildNews = 5,
  GuildStore = 6,
};

enum class PresenceStatus : int { Online, Idle, DoNotDisturb, Offline };

} // namespace gateway_cache
