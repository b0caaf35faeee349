#pragma once

#include "gateway_cache/entities.hpp"

#include <optional>
#include <string>
#include <utility>

namespace gateway_cache::test {

inline User make_user(Snowflake id, std::string username = "user") {
  User user;
  user.id = id;
  user.username = std::move(username);
  user.discriminator = "0001";
  return user;
}

inline OwnUser make_me(Snowflake id) {
  OwnUser me;
  me.id = id;
  me.username = "me";
  me.discriminator = "0420";
  me.is_bot = true;
  me.is_verified = true;
  return me;
}

inline Guild make_guild(Snowflake id, std::string name = "guild") {
  Guild guild;
  guild.id = id;
  guild.name = std::move(name);
  guild.owner_id = 1;
  guild.region = "europe";
  return guild;
}

inline Member make_member(Snowflake guild_id, const User &user) {
  Member member;
  member.user = user;
  member.guild_id = guild_id;
  member.nickname = "nick";
  member.role_ids = {guild_id};
  member.joined_at = TimePoint{std::chrono::seconds{1600000000}};
  return member;
}

inline Role make_role(Snowflake guild_id, Snowflake id,
                      std::string name = "role") {
  Role role;
  role.id = id;
  role.guild_id = guild_id;
  role.name = std::move(name);
  role.position = 1;
  return role;
}

inline KnownCustomEmoji make_emoji(Snowflake guild_id, Snowflake id,
                                   std::optional<User> creator) {
  KnownCustomEmoji emoji;
  emoji.id = id;
  emoji.guild_id = guild_id;
  emoji.name = "emoji";
  emoji.user = std::move(creator);
  return emoji;
}

inline GuildChannel make_guild_channel(Snowflake guild_id, Snowflake id,
                                       std::string name = "general") {
  GuildChannel channel;
  channel.id = id;
  channel.guild_id = guild_id;
  channel.name = std::move(name);
  return channel;
}

inline MemberPresence make_presence(Snowflake guild_id, Snowflake user_id,
                                    PresenceStatus status =
                                        PresenceStatus::Online) {
  MemberPresence presence;
  presence.guild_id = guild_id;
  presence.user_id = user_id;
  presence.visible_status = status;
  presence.client_status.desktop = status;
  return presence;
}

inline VoiceState make_voice_state(Snowflake guild_id, Snowflake channel_id,
                                   const User &user) {
  VoiceState voice_state;
  voice_state.guild_id = guild_id;
  voice_state.channel_id = channel_id;
  voice_state.user_id = user.id;
  voice_state.member = make_member(guild_id, user);
  voice_state.session_id = "session-" + std::to_string(user.id);
  return voice_state;
}

inline DMChannel make_dm_channel(Snowflake id, const User &recipient) {
  DMChannel channel;
  channel.id = id;
  channel.recipient = recipient;
  return channel;
}

inline Message make_message(Snowflake id, Snowflake channel_id,
                            const User &author,
                            std::string content = "hello") {
  Message message;
  message.id = id;
  message.channel_id = channel_id;
  message.author = author;
  message.content = std::move(content);
  message.timestamp = TimePoint{std::chrono::seconds{1600000000}};
  return message;
}

} // namespace gateway_cache::test
