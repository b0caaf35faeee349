#pragma once

#include "gateway_cache/entities.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gateway_cache {

// Compact records: only the fields that cannot be recovered from a shared
// dependency are stored. Users are referenced by id and resolved against the
// UserStore on read.

struct DMChannelData {
  Snowflake id{0};
  std::optional<std::string> name;
  std::optional<Snowflake> last_message_id;
  Snowflake recipient_id{0};

  bool operator==(const DMChannelData &) const = default;
};

struct MemberData {
  Snowflake id{0};
  Snowflake guild_id{0};
  std::optional<std::string> nickname;
  std::vector<Snowflake> role_ids;
  TimePoint joined_at{};
  std::optional<TimePoint> premium_since;
  bool is_deaf{false};
  bool is_mute{false};

  bool operator==(const MemberData &) const = default;
};

struct VoiceStateData {
  std::optional<Snowflake> channel_id;
  Snowflake guild_id{0};
  bool is_guild_deafened{false};
  bool is_guild_muted{false};
  bool is_self_deafened{false};
  bool is_self_muted{false};
  bool is_streaming{false};
  bool is_suppressed{false};
  bool is_video_enabled{false};
  Snowflake user_id{0};
  std::string session_id;

  bool operator==(const VoiceStateData &) const = default;
};

struct KnownCustomEmojiData {
  Snowflake id{0};
  Snowflake guild_id{0};
  std::string name;
  bool is_animated{false};
  std::vector<Snowflake> role_ids;
  std::optional<Snowflake> user_id;
  bool is_colons_required{true};
  bool is_managed{false};
  bool is_available{true};

  bool operator==(const KnownCustomEmojiData &) const = default;
};

struct MessageData {
  Snowflake id{0};
  Snowflake channel_id{0};
  std::optional<Snowflake> guild_id;
  Snowflake author_id{0};
  std::string content;
  TimePoint timestamp{};
  std::optional<TimePoint> edited_timestamp;
  bool is_tts{false};
  bool is_mentioning_everyone{false};
  std::vector<Snowflake> user_mentions;
  std::vector<Snowflake> role_mentions;
  bool is_pinned{false};
  std::optional<Snowflake> webhook_id;
  int type{0};

  bool operator==(const MessageData &) const = default;
};

// Everything the cache knows about one guild. The guild entity itself is
// absent until a full guild payload has been seen; sub-collections may be
// populated before that.
struct GuildRecord {
  std::optional<Guild> guild;
  // Undetermined until the gateway says otherwise.
  std::optional<bool> is_available;
  std::unordered_map<Snowflake, MemberData> members;
  std::unordered_map<Snowflake, VoiceStateData> voice_states;
  std::unordered_map<Snowflake, Role> roles;
  std::unordered_map<Snowflake, KnownCustomEmojiData> emojis;
  std::unordered_map<Snowflake, GuildChannel> channels;
  std::unordered_map<Snowflake, MemberPresence> presences;
  // User references held by members, voice states and emoji creators of
  // this guild.
  std::size_t user_references{0};

  bool empty() const {
    return !guild.has_value() && members.empty() && voice_states.empty() &&
           roles.empty() && emojis.empty() && channels.empty() &&
           presences.empty() && user_references == 0;
  }

  bool operator==(const GuildRecord &) const = default;
};

} // namespace gateway_cache
