#include "gateway_cache/cache_state.hpp"

#include "gateway_cache/logging.hpp"
#include "gateway_cache/views.hpp"

namespace gateway_cache {

// Members ------------------------------------------------------------------

std::optional<Member> CacheState::resolve_member(const MemberData &data) const {
  auto member = build_member(data, users_);
  if (!member.has_value()) {
    ++counters_.unresolved_records;
    GATEWAY_CACHE_LOG_DEBUG("member skipped, user not cached",
                            {id_field("guild_id", data.guild_id),
                             id_field("user_id", data.id)});
  }
  return member;
}

std::optional<Member> CacheState::get_member(Snowflake guild_id,
                                             Snowflake user_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->members.find(user_id);
  if (it == record->members.end())
    return std::nullopt;
  return resolve_member(it->second);
}

std::unordered_map<Snowflake, Member>
CacheState::get_members_view(Snowflake guild_id) const {
  std::unordered_map<Snowflake, Member> out;
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;
  for (const auto &[user_id, data] : record->members) {
    if (auto member = resolve_member(data))
      out.emplace(user_id, std::move(*member));
  }
  return out;
}

void CacheState::set_member(const Member &member) {
  auto &record = get_or_create_guild_record(member.guild_id);
  auto data = to_member_data(member);
  auto it = record.members.find(data.id);
  if (it == record.members.end()) {
    acquire_user(record, member.user);
    record.members.emplace(data.id, std::move(data));
    return;
  }
  users_.set(member.user);
  it->second = std::move(data);
}

std::optional<Member> CacheState::delete_member(Snowflake guild_id,
                                                Snowflake user_id) {
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->members.find(user_id);
  if (it == record->members.end())
    return std::nullopt;

  auto member = resolve_member(it->second);
  record->members.erase(it);
  release_user(*record, user_id);
  collect_if_empty(guild_id);
  return member;
}

Change<Member> CacheState::update_member(const Member &member) {
  auto old = get_member(member.guild_id, member.user.id);
  set_member(member);
  return {std::move(old), get_member(member.guild_id, member.user.id)};
}

std::unordered_map<Snowflake, Member>
CacheState::clear_members(Snowflake guild_id) {
  std::unordered_map<Snowflake, Member> out;
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;

  auto members = std::move(record->members);
  record->members.clear();
  for (const auto &[user_id, data] : members) {
    if (auto member = resolve_member(data))
      out.emplace(user_id, std::move(*member));
    release_user(*record, user_id);
  }
  collect_if_empty(guild_id);
  return out;
}

// Voice states -------------------------------------------------------------

std::optional<VoiceState>
CacheState::resolve_voice_state(const GuildRecord &record,
                                const VoiceStateData &data) const {
  if (!users_.contains(data.user_id)) {
    ++counters_.unresolved_records;
    GATEWAY_CACHE_LOG_DEBUG("voice state skipped, user not cached",
                            {id_field("guild_id", data.guild_id),
                             id_field("user_id", data.user_id)});
    return std::nullopt;
  }
  std::optional<Member> member;
  auto it = record.members.find(data.user_id);
  if (it != record.members.end())
    member = resolve_member(it->second);
  return build_voice_state(data, std::move(member));
}

std::optional<VoiceState> CacheState::get_voice_state(Snowflake guild_id,
                                                      Snowflake user_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->voice_states.find(user_id);
  if (it == record->voice_states.end())
    return std::nullopt;
  return resolve_voice_state(*record, it->second);
}

std::unordered_map<Snowflake, VoiceState>
CacheState::get_voice_states_view(Snowflake guild_id) const {
  std::unordered_map<Snowflake, VoiceState> out;
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;
  for (const auto &[user_id, data] : record->voice_states) {
    if (auto voice_state = resolve_voice_state(*record, data))
      out.emplace(user_id, std::move(*voice_state));
  }
  return out;
}

std::unordered_map<Snowflake, VoiceState>
CacheState::get_voice_states_view_for_channel(Snowflake guild_id,
                                              Snowflake channel_id) const {
  std::unordered_map<Snowflake, VoiceState> out;
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;
  for (const auto &[user_id, data] : record->voice_states) {
    if (data.channel_id != channel_id)
      continue;
    if (auto voice_state = resolve_voice_state(*record, data))
      out.emplace(user_id, std::move(*voice_state));
  }
  return out;
}

void CacheState::set_voice_state(const VoiceState &voice_state) {
  if (voice_state.member.has_value())
    set_member(*voice_state.member);
  auto &record = get_or_create_guild_record(voice_state.guild_id);
  if (voice_state.member.has_value())
    acquire_user(record, voice_state.member->user);
  else
    acquire_user(record, voice_state.user_id);

  auto data = to_voice_state_data(voice_state);
  auto it = record.voice_states.find(voice_state.user_id);
  if (it == record.voice_states.end()) {
    record.voice_states.emplace(voice_state.user_id, std::move(data));
    return;
  }
  it->second = std::move(data);
  release_user(record, voice_state.user_id);
}

std::optional<VoiceState> CacheState::delete_voice_state(Snowflake guild_id,
                                                         Snowflake user_id) {
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->voice_states.find(user_id);
  if (it == record->voice_states.end())
    return std::nullopt;

  auto voice_state = resolve_voice_state(*record, it->second);
  record->voice_states.erase(it);
  release_user(*record, user_id);
  collect_if_empty(guild_id);
  return voice_state;
}

Change<VoiceState>
CacheState::update_voice_state(const VoiceState &voice_state) {
  auto old = get_voice_state(voice_state.guild_id, voice_state.user_id);
  set_voice_state(voice_state);
  return {std::move(old),
          get_voice_state(voice_state.guild_id, voice_state.user_id)};
}

std::unordered_map<Snowflake, VoiceState>
CacheState::clear_voice_states(Snowflake guild_id) {
  std::unordered_map<Snowflake, VoiceState> out;
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;

  auto voice_states = std::move(record->voice_states);
  record->voice_states.clear();
  for (const auto &[user_id, data] : voice_states) {
    if (auto voice_state = resolve_voice_state(*record, data))
      out.emplace(user_id, std::move(*voice_state));
    release_user(*record, user_id);
  }
  collect_if_empty(guild_id);
  return out;
}

// Roles --------------------------------------------------------------------

std::optional<Role> CacheState::get_role(Snowflake role_id) const {
  auto idx = role_guilds_.find(role_id);
  if (idx == role_guilds_.end())
    return std::nullopt;
  const auto *record = find_record(idx->second);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->roles.find(role_id);
  if (it == record->roles.end())
    return std::nullopt;
  return it->second;
}

std::unordered_map<Snowflake, Role>
CacheState::get_roles_view(Snowflake guild_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return {};
  return record->roles;
}

void CacheState::set_role(const Role &role) {
  auto idx = role_guilds_.find(role.id);
  if (idx != role_guilds_.end() && idx->second != role.guild_id)
    delete_role(role.id);

  auto &record = get_or_create_guild_record(role.guild_id);
  record.roles[role.id] = role;
  role_guilds_[role.id] = role.guild_id;
}

std::optional<Role> CacheState::delete_role(Snowflake role_id) {
  auto idx = role_guilds_.find(role_id);
  if (idx == role_guilds_.end())
    return std::nullopt;
  const Snowflake guild_id = idx->second;
  role_guilds_.erase(idx);

  auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->roles.find(role_id);
  if (it == record->roles.end())
    return std::nullopt;
  Role role = std::move(it->second);
  record->roles.erase(it);
  collect_if_empty(guild_id);
  return role;
}

Change<Role> CacheState::update_role(const Role &role) {
  auto old = get_role(role.id);
  set_role(role);
  return {std::move(old), get_role(role.id)};
}

std::unordered_map<Snowflake, Role>
CacheState::clear_roles(Snowflake guild_id) {
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return {};
  auto roles = std::move(record->roles);
  record->roles.clear();
  for (const auto &[role_id, role] : roles)
    role_guilds_.erase(role_id);
  collect_if_empty(guild_id);
  return roles;
}

// Custom emojis ------------------------------------------------------------

std::optional<KnownCustomEmoji>
CacheState::resolve_emoji(const KnownCustomEmojiData &data) const {
  auto emoji = build_emoji(data, users_);
  if (!emoji.has_value()) {
    ++counters_.unresolved_records;
    GATEWAY_CACHE_LOG_DEBUG("emoji skipped, creator not cached",
                            {id_field("emoji_id", data.id)});
  }
  return emoji;
}

void CacheState::release_emoji_data(GuildRecord &record,
                                    const KnownCustomEmojiData &data) {
  if (data.user_id.has_value())
    release_user(record, *data.user_id);
}

std::optional<KnownCustomEmoji>
CacheState::get_emoji(Snowflake emoji_id) const {
  auto idx = emoji_guilds_.find(emoji_id);
  if (idx == emoji_guilds_.end())
    return std::nullopt;
  const auto *record = find_record(idx->second);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->emojis.find(emoji_id);
  if (it == record->emojis.end())
    return std::nullopt;
  return resolve_emoji(it->second);
}

std::unordered_map<Snowflake, KnownCustomEmoji>
CacheState::get_emojis_view(Snowflake guild_id) const {
  std::unordered_map<Snowflake, KnownCustomEmoji> out;
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;
  for (const auto &[emoji_id, data] : record->emojis) {
    if (auto emoji = resolve_emoji(data))
      out.emplace(emoji_id, std::move(*emoji));
  }
  return out;
}

void CacheState::set_emoji(const KnownCustomEmoji &emoji) {
  auto idx = emoji_guilds_.find(emoji.id);
  if (idx != emoji_guilds_.end() && idx->second != emoji.guild_id)
    delete_emoji(emoji.id);

  auto &record = get_or_create_guild_record(emoji.guild_id);
  // Take the new creator reference before dropping the old one so a creator
  // that stays the same never passes through zero.
  if (emoji.user.has_value())
    acquire_user(record, *emoji.user);

  auto data = to_emoji_data(emoji);
  auto it = record.emojis.find(emoji.id);
  if (it == record.emojis.end()) {
    record.emojis.emplace(emoji.id, std::move(data));
  } else {
    auto previous = std::move(it->second);
    it->second = std::move(data);
    release_emoji_data(record, previous);
  }
  emoji_guilds_[emoji.id] = emoji.guild_id;
}

std::optional<KnownCustomEmoji> CacheState::delete_emoji(Snowflake emoji_id) {
  auto idx = emoji_guilds_.find(emoji_id);
  if (idx == emoji_guilds_.end())
    return std::nullopt;
  const Snowflake guild_id = idx->second;
  emoji_guilds_.erase(idx);

  auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->emojis.find(emoji_id);
  if (it == record->emojis.end())
    return std::nullopt;

  auto emoji = resolve_emoji(it->second);
  auto data = std::move(it->second);
  record->emojis.erase(it);
  release_emoji_data(*record, data);
  collect_if_empty(guild_id);
  return emoji;
}

Change<KnownCustomEmoji>
CacheState::update_emoji(const KnownCustomEmoji &emoji) {
  auto old = get_emoji(emoji.id);
  set_emoji(emoji);
  return {std::move(old), get_emoji(emoji.id)};
}

std::unordered_map<Snowflake, KnownCustomEmoji>
CacheState::clear_emojis(Snowflake guild_id) {
  std::unordered_map<Snowflake, KnownCustomEmoji> out;
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return out;

  auto emojis = std::move(record->emojis);
  record->emojis.clear();
  for (const auto &[emoji_id, data] : emojis) {
    if (auto emoji = resolve_emoji(data))
      out.emplace(emoji_id, std::move(*emoji));
    emoji_guilds_.erase(emoji_id);
    release_emoji_data(*record, data);
  }
  collect_if_empty(guild_id);
  return out;
}

// Guild channels -----------------------------------------------------------

std::optional<GuildChannel>
CacheState::find_guild_channel(Snowflake channel_id) const {
  auto idx = channel_guilds_.find(channel_id);
  if (idx == channel_guilds_.end())
    return std::nullopt;
  const auto *record = find_record(idx->second);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->channels.find(channel_id);
  if (it == record->channels.end())
    return std::nullopt;
  return it->second;
}

std::optional<GuildChannel>
CacheState::get_guild_channel(Snowflake channel_id) const {
  return find_guild_channel(channel_id);
}

std::unordered_map<Snowflake, GuildChannel>
CacheState::get_guild_channels_view(Snowflake guild_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return {};
  return record->channels;
}

void CacheState::set_guild_channel(const GuildChannel &channel) {
  auto idx = channel_guilds_.find(channel.id);
  if (idx != channel_guilds_.end() && idx->second != channel.guild_id)
    delete_guild_channel(channel.id);

  auto &record = get_or_create_guild_record(channel.guild_id);
  record.channels[channel.id] = channel;
  channel_guilds_[channel.id] = channel.guild_id;
}

std::optional<GuildChannel>
CacheState::delete_guild_channel(Snowflake channel_id) {
  auto idx = channel_guilds_.find(channel_id);
  if (idx == channel_guilds_.end())
    return std::nullopt;
  const Snowflake guild_id = idx->second;
  channel_guilds_.erase(idx);

  auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->channels.find(channel_id);
  if (it == record->channels.end())
    return std::nullopt;
  GuildChannel channel = std::move(it->second);
  record->channels.erase(it);
  collect_if_empty(guild_id);
  return channel;
}

Change<GuildChannel>
CacheState::update_guild_channel(const GuildChannel &channel) {
  auto old = get_guild_channel(channel.id);
  set_guild_channel(channel);
  return {std::move(old), get_guild_channel(channel.id)};
}

std::unordered_map<Snowflake, GuildChannel>
CacheState::clear_guild_channels(Snowflake guild_id) {
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return {};
  auto channels = std::move(record->channels);
  record->channels.clear();
  for (const auto &[channel_id, channel] : channels)
    channel_guilds_.erase(channel_id);
  collect_if_empty(guild_id);
  return channels;
}

bool CacheState::update_last_pinned_timestamp(
    Snowflake channel_id, std::optional<TimePoint> timestamp) {
  auto idx = channel_guilds_.find(channel_id);
  if (idx == channel_guilds_.end())
    return false;
  auto *record = find_record(idx->second);
  if (record == nullptr)
    return false;
  auto it = record->channels.find(channel_id);
  if (it == record->channels.end())
    return false;
  it->second.last_pin_timestamp = timestamp;
  return true;
}

// Presences ----------------------------------------------------------------

std::optional<MemberPresence>
CacheState::get_presence(Snowflake guild_id, Snowflake user_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->presences.find(user_id);
  if (it == record->presences.end())
    return std::nullopt;
  return it->second;
}

std::unordered_map<Snowflake, MemberPresence>
CacheState::get_presences_view(Snowflake guild_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return {};
  return record->presences;
}

void CacheState::set_presence(const MemberPresence &presence) {
  auto &record = get_or_create_guild_record(presence.guild_id);
  record.presences[presence.user_id] = presence;
}

std::optional<MemberPresence> CacheState::delete_presence(Snowflake guild_id,
                                                          Snowflake user_id) {
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  auto it = record->presences.find(user_id);
  if (it == record->presences.end())
    return std::nullopt;
  MemberPresence presence = std::move(it->second);
  record->presences.erase(it);
  collect_if_empty(guild_id);
  return presence;
}

Change<MemberPresence>
CacheState::update_presence(const MemberPresence &presence) {
  auto old = get_presence(presence.guild_id, presence.user_id);
  set_presence(presence);
  return {std::move(old), get_presence(presence.guild_id, presence.user_id)};
}

std::unordered_map<Snowflake, MemberPresence>
CacheState::clear_presences(Snowflake guild_id) {
  auto *record = find_record(guild_id);
  if (record == nullptr)
    return {};
  auto presences = std::move(record->presences);
  record->presences.clear();
  collect_if_empty(guild_id);
  return presences;
}

} // namespace gateway_cache
