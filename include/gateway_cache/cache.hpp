#pragma once

#include "gateway_cache/cache_state.hpp"

#include <shared_mutex>

namespace gateway_cache {

// Gateway state cache. Wraps CacheState behind a reader/writer lock: reads
// that leave the containers untouched share the lock, mutations and the LRU
// point reads (which reorder recency) hold it exclusively. Everything handed
// back is a copy, so nothing returned refers into the locked state.
class Cache {
public:
  explicit Cache(CacheConfig cfg = {});

  const CacheConfig &config() const { return state_.config(); }

  // --- own user ------------------------------------------------------------
  std::optional<OwnUser> get_me() const;
  void set_me(const OwnUser &me);
  std::optional<OwnUser> delete_me();
  Change<OwnUser> update_me(const OwnUser &me);

  // --- users ---------------------------------------------------------------
  std::optional<User> get_user(Snowflake user_id) const;
  std::unordered_map<Snowflake, User> get_users_view() const;
  void set_user(const User &user);
  std::optional<User> delete_user(Snowflake user_id);
  Change<User> update_user(const User &user);
  std::unordered_map<Snowflake, User> clear_users();
  std::size_t get_user_reference_count(Snowflake user_id) const;

  // --- guilds --------------------------------------------------------------
  std::optional<GuildRecord> get_guild_record(Snowflake guild_id) const;
  GuildRecord get_or_create_guild_record(Snowflake guild_id);
  // Throws UnavailableGuildError when the guild is marked unavailable.
  std::optional<Guild> get_guild(Snowflake guild_id) const;
  std::unordered_map<Snowflake, Guild> get_guilds_view() const;
  void set_guild(const Guild &guild);
  std::optional<Guild> delete_guild(Snowflake guild_id);
  Change<Guild> update_guild(const Guild &guild);
  void set_guild_availability(Snowflake guild_id, bool is_available);
  void set_initial_unavailable_guilds(const std::vector<Snowflake> &guild_ids);
  std::unordered_map<Snowflake, Guild> clear_guilds();
  // Drops the guild together with everything it owns.
  std::optional<Guild> purge_guild(Snowflake guild_id);
  std::size_t guild_record_count() const;

  // --- members -------------------------------------------------------------
  std::optional<Member> get_member(Snowflake guild_id, Snowflake user_id) const;
  std::unordered_map<Snowflake, Member>
  get_members_view(Snowflake guild_id) const;
  void set_member(const Member &member);
  std::optional<Member> delete_member(Snowflake guild_id, Snowflake user_id);
  Change<Member> update_member(const Member &member);
  std::unordered_map<Snowflake, Member> clear_members(Snowflake guild_id);

  // --- voice states --------------------------------------------------------
  std::optional<VoiceState> get_voice_state(Snowflake guild_id,
                                            Snowflake user_id) const;
  std::unordered_map<Snowflake, VoiceState>
  get_voice_states_view(Snowflake guild_id) const;
  std::unordered_map<Snowflake, VoiceState>
  get_voice_states_view_for_channel(Snowflake guild_id,
                                    Snowflake channel_id) const;
  void set_voice_state(const VoiceState &voice_state);
  std::optional<VoiceState> delete_voice_state(Snowflake guild_id,
                                               Snowflake user_id);
  Change<VoiceState> update_voice_state(const VoiceState &voice_state);
  std::unordered_map<Snowflake, VoiceState>
  clear_voice_states(Snowflake guild_id);

  // --- roles ---------------------------------------------------------------
  std::optional<Role> get_role(Snowflake role_id) const;
  std::unordered_map<Snowflake, Role> get_roles_view(Snowflake guild_id) const;
  void set_role(const Role &role);
  std::optional<Role> delete_role(Snowflake role_id);
  Change<Role> update_role(const Role &role);
  std::unordered_map<Snowflake, Role> clear_roles(Snowflake guild_id);

  // --- custom emojis -------------------------------------------------------
  std::optional<KnownCustomEmoji> get_emoji(Snowflake emoji_id) const;
  std::unordered_map<Snowflake, KnownCustomEmoji>
  get_emojis_view(Snowflake guild_id) const;
  void set_emoji(const KnownCustomEmoji &emoji);
  std::optional<KnownCustomEmoji> delete_emoji(Snowflake emoji_id);
  Change<KnownCustomEmoji> update_emoji(const KnownCustomEmoji &emoji);
  std::unordered_map<Snowflake, KnownCustomEmoji>
  clear_emojis(Snowflake guild_id);

  // --- guild channels ------------------------------------------------------
  std::optional<GuildChannel> get_guild_channel(Snowflake channel_id) const;
  std::unordered_map<Snowflake, GuildChannel>
  get_guild_channels_view(Snowflake guild_id) const;
  void set_guild_channel(const GuildChannel &channel);
  std::optional<GuildChannel> delete_guild_channel(Snowflake channel_id);
  Change<GuildChannel> update_guild_channel(const GuildChannel &channel);
  std::unordered_map<Snowflake, GuildChannel>
  clear_guild_channels(Snowflake guild_id);
  // False when the channel is not a cached guild channel.
  bool update_last_pinned_timestamp(Snowflake channel_id,
                                    std::optional<TimePoint> timestamp);

  // --- presences -----------------------------------------------------------
  std::optional<MemberPresence> get_presence(Snowflake guild_id,
                                             Snowflake user_id) const;
  std::unordered_map<Snowflake, MemberPresence>
  get_presences_view(Snowflake guild_id) const;
  void set_presence(const MemberPresence &presence);
  std::optional<MemberPresence> delete_presence(Snowflake guild_id,
                                                Snowflake user_id);
  Change<MemberPresence> update_presence(const MemberPresence &presence);
  std::unordered_map<Snowflake, MemberPresence>
  clear_presences(Snowflake guild_id);

  // --- DM channels (bounded, keyed by recipient id) ------------------------
  std::optional<DMChannel> get_dm_channel(Snowflake recipient_id);
  std::unordered_map<Snowflake, DMChannel> get_dm_channels_view() const;
  void set_dm_channel(const DMChannel &channel);
  std::optional<DMChannel> delete_dm_channel(Snowflake recipient_id);
  Change<DMChannel> update_dm_channel(const DMChannel &channel);
  std::unordered_map<Snowflake, DMChannel> clear_dm_channels();

  // --- messages (bounded) --------------------------------------------------
  std::optional<Message> get_message(Snowflake message_id);
  std::unordered_map<Snowflake, Message> get_messages_view() const;
  void set_message(const Message &message);
  std::optional<Message> delete_message(Snowflake message_id);
  Change<Message> update_message(const Message &message);
  std::unordered_map<Snowflake, Message> clear_messages();

  CacheStats stats() const;
  std::string info() const;

private:
  mutable std::shared_mutex mutex_;
  CacheState state_;
};

} // namespace gateway_cache
