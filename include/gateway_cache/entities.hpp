#pragma once

#include "gateway_cache/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gateway_cache {

// Fully populated entities as produced by the payload decoder and as handed
// back to consumers by the cache read path.

struct User {
  Snowflake id{0};
  std::string username;
  std::string discriminator;
  std::optional<std::string> avatar_hash;
  bool is_bot{false};
  bool is_system{false};
  std::uint64_t flags{0};

  bool operator==(const User &) const = default;
};

struct OwnUser : User {
  bool is_mfa_enabled{false};
  std::optional<std::string> locale;
  std::optional<bool> is_verified;
  std::optional<std::string> email;
  std::optional<int> premium_type;

  bool operator==(const OwnUser &) const = default;
};

struct Role {
  Snowflake id{0};
  Snowflake guild_id{0};
  std::string name;
  std::uint32_t color{0};
  bool is_hoisted{false};
  int position{0};
  std::uint64_t permissions{0};
  bool is_managed{false};
  bool is_mentionable{false};

  bool operator==(const Role &) const = default;
};

struct KnownCustomEmoji {
  Snowflake id{0};
  Snowflake guild_id{0};
  std::string name;
  bool is_animated{false};
  std::vector<Snowflake> role_ids;
  std::optional<User> user;
  bool is_colons_required{true};
  bool is_managed{false};
  bool is_available{true};

  bool operator==(const KnownCustomEmoji &) const = default;
};

struct Member {
  User user;
  Snowflake guild_id{0};
  std::optional<std::string> nickname;
  std::vector<Snowflake> role_ids;
  TimePoint joined_at{};
  std::optional<TimePoint> premium_since;
  bool is_deaf{false};
  bool is_mute{false};

  bool operator==(const Member &) const = default;
};

struct DMChannel {
  Snowflake id{0};
  ChannelType type{ChannelType::DM};
  std::optional<std::string> name;
  std::optional<Snowflake> last_message_id;
  User recipient;

  bool operator==(const DMChannel &) const = default;
};

struct PermissionOverwrite {
  Snowflake id{0};
  bool is_member{false};
  std::uint64_t allow{0};
  std::uint64_t deny{0};

  bool operator==(const PermissionOverwrite &) const = default;
};

struct GuildChannel {
  Snowflake id{0};
  Snowflake guild_id{0};
  ChannelType type{ChannelType::GuildText};
  std::string name;
  int position{0};
  std::optional<Snowflake> parent_id;
  bool is_nsfw{false};
  std::optional<std::string> topic;
  std::optional<Snowflake> last_message_id;
  std::optional<TimePoint> last_pin_timestamp;
  std::optional<int> rate_limit_per_user;
  std::optional<int> bitrate;
  std::optional<int> user_limit;
  std::vector<PermissionOverwrite> permission_overwrites;

  bool operator==(const GuildChannel &) const = default;
};

struct Activity {
  std::string name;
  int type{0};
  std::optional<std::string> url;
  std::optional<std::string> state;

  bool operator==(const Activity &) const = default;
};

struct ClientStatus {
  PresenceStatus desktop{PresenceStatus::Offline};
  PresenceStatus mobile{PresenceStatus::Offline};
  PresenceStatus web{PresenceStatus::Offline};

  bool operator==(const ClientStatus &) const = default;
};

struct MemberPresence {
  Snowflake user_id{0};
  Snowflake guild_id{0};
  PresenceStatus visible_status{PresenceStatus::Offline};
  std::vector<Activity> activities;
  ClientStatus client_status;

  bool operator==(const MemberPresence &) const = default;
};

struct VoiceState {
  Snowflake guild_id{0};
  std::optional<Snowflake> channel_id;
  Snowflake user_id{0};
  std::optional<Member> member;
  std::string session_id;
  bool is_guild_deafened{false};
  bool is_guild_muted{false};
  bool is_self_deafened{false};
  bool is_self_muted{false};
  bool is_streaming{false};
  bool is_suppressed{false};
  bool is_video_enabled{false};

  bool operator==(const VoiceState &) const = default;
};

struct Message {
  Snowflake id{0};
  Snowflake channel_id{0};
  std::optional<Snowflake> guild_id;
  User author;
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

  bool operator==(const Message &) const = default;
};

// The guild entity proper. Roles, emojis, channels, members, presences and
// voice states arrive alongside it but live in the guild record's
// sub-collections, never inside this struct.
struct Guild {
  Snowflake id{0};
  std::string name;
  std::optional<std::string> icon_hash;
  std::vector<std::string> features;
  std::optional<std::string> splash_hash;
  Snowflake owner_id{0};
  std::string region;
  std::optional<Snowflake> afk_channel_id;
  std::chrono::seconds afk_timeout{0};
  int verification_level{0};
  int default_message_notifications{0};
  int explicit_content_filter{0};
  int mfa_level{0};
  std::optional<Snowflake> application_id;
  std::optional<Snowflake> system_channel_id;
  std::optional<Snowflake> rules_channel_id;
  std::optional<Snowflake> public_updates_channel_id;
  std::optional<TimePoint> joined_at;
  std::optional<bool> is_large;
  std::optional<int> member_count;
  std::optional<int> max_members;
  std::optional<int> max_presences;
  std::optional<std::string> vanity_url_code;
  std::optional<std::string> description;
  std::optional<std::string> banner_hash;
  int premium_tier{0};
  std::optional<int> premium_subscription_count;
  std::string preferred_locale{"en-US"};

  bool operator==(const Guild &) const = default;
};

} // namespace gateway_cache
