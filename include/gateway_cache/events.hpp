#pragma once

#include "gateway_cache/cache.hpp"
#include "gateway_cache/entities.hpp"

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace gateway_cache {

// Decoded gateway events the cache consumes. Payload decoding happens
// upstream; these carry full entities only.

struct ReadyEvent {
  OwnUser me;
  std::vector<Snowflake> unavailable_guild_ids;
};

struct GuildCreateEvent {
  Guild guild;
  std::vector<Role> roles;
  std::vector<KnownCustomEmoji> emojis;
  std::vector<GuildChannel> channels;
  std::vector<Member> members;
  std::vector<MemberPresence> presences;
  std::vector<VoiceState> voice_states;
};

struct GuildUpdateEvent {
  Guild guild;
  std::vector<Role> roles;
  std::vector<KnownCustomEmoji> emojis;
};

struct GuildDeleteEvent {
  Snowflake guild_id{0};
  // Outage rather than a leave or kick.
  bool unavailable{false};
};

struct GuildMemberAddEvent {
  Member member;
};

struct GuildMemberUpdateEvent {
  Member member;
};

struct GuildMemberRemoveEvent {
  Snowflake guild_id{0};
  User user;
};

struct GuildRoleCreateEvent {
  Role role;
};

struct GuildRoleUpdateEvent {
  Role role;
};

struct GuildRoleDeleteEvent {
  Snowflake guild_id{0};
  Snowflake role_id{0};
};

struct GuildEmojisUpdateEvent {
  Snowflake guild_id{0};
  std::vector<KnownCustomEmoji> emojis;
};

using Channel = std::variant<GuildChannel, DMChannel>;

struct ChannelCreateEvent {
  Channel channel;
};

struct ChannelUpdateEvent {
  Channel channel;
};

struct ChannelDeleteEvent {
  Channel channel;
};

// Pins in DM channels are not tracked; guild_id is empty for those.
struct ChannelPinsUpdateEvent {
  Snowflake channel_id{0};
  std::optional<Snowflake> guild_id;
  std::optional<TimePoint> last_pin_timestamp;
};

struct MessageCreateEvent {
  Message message;
};

struct MessageUpdateEvent {
  Message message;
};

struct MessageDeleteEvent {
  Snowflake message_id{0};
  Snowflake channel_id{0};
  std::optional<Snowflake> guild_id;
};

struct PresenceUpdateEvent {
  MemberPresence presence;
  // Present when the payload carried changed user fields.
  std::optional<User> user;
};

struct VoiceStateUpdateEvent {
  VoiceState voice_state;
};

struct UserUpdateEvent {
  OwnUser me;
};

using Event =
    std::variant<ReadyEvent, GuildCreateEvent, GuildUpdateEvent,
                 GuildDeleteEvent, GuildMemberAddEvent, GuildMemberUpdateEvent,
                 GuildMemberRemoveEvent, GuildRoleCreateEvent,
                 GuildRoleUpdateEvent, GuildRoleDeleteEvent,
                 GuildEmojisUpdateEvent, ChannelCreateEvent, ChannelUpdateEvent,
                 ChannelDeleteEvent, ChannelPinsUpdateEvent,
                 MessageCreateEvent, MessageUpdateEvent, MessageDeleteEvent,
                 PresenceUpdateEvent, VoiceStateUpdateEvent, UserUpdateEvent>;

struct IngestorStats {
  std::uint64_t applied{0};
  std::uint64_t unknown_guild{0};
  std::uint64_t guild_outages{0};
};

// Applies decoded events to a cache. The cache must outlive the ingestor.
class EventIngestor {
public:
  explicit EventIngestor(Cache &cache);

  void apply(const Event &event);
  const IngestorStats &stats() const { return stats_; }

private:
  void handle(const ReadyEvent &event);
  void handle(const GuildCreateEvent &event);
  void handle(const GuildUpdateEvent &event);
  void handle(const GuildDeleteEvent &event);
  void handle(const GuildMemberAddEvent &event);
  void handle(const GuildMemberUpdateEvent &event);
  void handle(const GuildMemberRemoveEvent &event);
  void handle(const GuildRoleCreateEvent &event);
  void handle(const GuildRoleUpdateEvent &event);
  void handle(const GuildRoleDeleteEvent &event);
  void handle(const GuildEmojisUpdateEvent &event);
  void handle(const ChannelCreateEvent &event);
  void handle(const ChannelUpdateEvent &event);
  void handle(const ChannelDeleteEvent &event);
  void handle(const ChannelPinsUpdateEvent &event);
  void handle(const MessageCreateEvent &event);
  void handle(const MessageUpdateEvent &event);
  void handle(const MessageDeleteEvent &event);
  void handle(const PresenceUpdateEvent &event);
  void handle(const VoiceStateUpdateEvent &event);
  void handle(const UserUpdateEvent &event);

  void put_channel(const Channel &channel);
  // Logs and counts events addressed to a guild with no record.
  bool known_guild(Snowflake guild_id, const char *event_name);

  Cache &cache_;
  IngestorStats stats_;
};

} // namespace gateway_cache
