#pragma once

#include "gateway_cache/config.hpp"
#include "gateway_cache/entities.hpp"
#include "gateway_cache/lru_cache.hpp"
#include "gateway_cache/records.hpp"
#include "gateway_cache/user_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gateway_cache {

// Before/after pair returned by the update_* operations. first is empty when
// the entity was not cached before the call.
template <typename T>
using Change = std::pair<std::optional<T>, std::optional<T>>;

struct CacheStats {
  std::size_t users{0};
  std::size_t referenced_users{0};
  std::size_t guild_records{0};
  std::size_t guilds{0};
  std::size_t unavailable_guilds{0};
  std::size_t members{0};
  std::size_t voice_states{0};
  std::size_t roles{0};
  std::size_t emojis{0};
  std::size_t guild_channels{0};
  std::size_t presences{0};
  std::size_t dm_channels{0};
  std::size_t messages{0};
  std::uint64_t dm_channel_evictions{0};
  std::uint64_t message_evictions{0};
  std::uint64_t unresolved_records{0};
  std::uint64_t guild_purges{0};
};

// Unsynchronized cache state behind Cache. Guild-owned entities live in
// per-guild records, users are shared and reference counted, DM channels and
// messages sit in bounded LRU caches. Every read rebuilds full entities from
// the compact records, every write decomposes them again.
//
// const members only read the containers; they may run concurrently with
// each other but never with a mutation.
class CacheState {
public:
  explicit CacheState(CacheConfig cfg = {});

  const CacheConfig &config() const { return cfg_; }

  // --- own user ------------------------------------------------------------
  std::optional<OwnUser> get_me() const { return me_; }
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
  const GuildRecord *get_guild_record(Snowflake guild_id) const;
  GuildRecord &get_or_create_guild_record(Snowflake guild_id);
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
  std::size_t guild_record_count() const { return guilds_.size(); }

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
  // Bumped from const reads, which may overlap.
  struct Counters {
    std::atomic<std::uint64_t> unresolved_records{0};
    std::atomic<std::uint64_t> guild_purges{0};
  };

  GuildRecord *find_record(Snowflake guild_id);
  const GuildRecord *find_record(Snowflake guild_id) const;
  // Removes the record when nothing is left in it and the gateway never
  // told us anything about the guild's availability.
  void collect_if_empty(Snowflake guild_id);
  void acquire_user(GuildRecord &record, const User &user);
  void acquire_user(GuildRecord &record, Snowflake user_id);
  void release_user(GuildRecord &record, Snowflake user_id);

  std::optional<Member> resolve_member(const MemberData &data) const;
  std::optional<KnownCustomEmoji>
  resolve_emoji(const KnownCustomEmojiData &data) const;
  std::optional<VoiceState>
  resolve_voice_state(const GuildRecord &record,
                      const VoiceStateData &data) const;
  std::optional<GuildChannel> find_guild_channel(Snowflake channel_id) const;
  void advance_last_message_id(Snowflake channel_id, Snowflake message_id);
  void release_emoji_data(GuildRecord &record,
                          const KnownCustomEmojiData &data);
  void forget_dm_channel(const DMChannelData &data);

  CacheConfig cfg_;
  std::optional<OwnUser> me_;
  UserStore users_;
  std::unordered_map<Snowflake, GuildRecord> guilds_;
  // Owned entities addressed by their own id: entity id -> guild id.
  std::unordered_map<Snowflake, Snowflake> role_guilds_;
  std::unordered_map<Snowflake, Snowflake> emoji_guilds_;
  std::unordered_map<Snowflake, Snowflake> channel_guilds_;
  LruCache<Snowflake, DMChannelData> dm_channels_;
  // DM channel id -> recipient id, kept in step with dm_channels_.
  std::unordered_map<Snowflake, Snowflake> dm_channel_recipients_;
  LruCache<Snowflake, MessageData> messages_;
  mutable Counters counters_;
};

} // namespace gateway_cache
