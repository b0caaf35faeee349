#include "gateway_cache/events.hpp"

#include "gateway_cache/logging.hpp"

#include <unordered_set>
#include <vector>

namespace gateway_cache {

namespace {

template <typename Map, typename Keep>
std::vector<Snowflake> stale_keys(const Map &entries, const Keep &current) {
  std::vector<Snowflake> stale;
  for (const auto &[id, entry] : entries) {
    if (!current.contains(id))
      stale.push_back(id);
  }
  return stale;
}

} // namespace

EventIngestor::EventIngestor(Cache &cache) : cache_(cache) {}

void EventIngestor::apply(const Event &event) {
  std::visit([this](const auto &e) { handle(e); }, event);
  ++stats_.applied;
}

void EventIngestor::handle(const ReadyEvent &event) {
  cache_.set_me(event.me);
  cache_.set_initial_unavailable_guilds(event.unavailable_guild_ids);
  GATEWAY_CACHE_LOG_INFO(
      "session ready",
      {id_field("user_id", event.me.id),
       int_field("guilds",
                 static_cast<std::int64_t>(event.unavailable_guild_ids.size()))});
}

void EventIngestor::handle(const GuildCreateEvent &event) {
  const Snowflake guild_id = event.guild.id;
  cache_.set_guild(event.guild);

  // A create replaces whatever an earlier session left behind. The new
  // entries go in first so users named by both sessions keep their
  // references throughout; leftovers are dropped afterwards.
  std::unordered_set<Snowflake> roles, emojis, channels, members, presences,
      voice_states;
  for (const auto &role : event.roles) {
    cache_.set_role(role);
    roles.insert(role.id);
  }
  for (const auto &emoji : event.emojis) {
    cache_.set_emoji(emoji);
    emojis.insert(emoji.id);
  }
  for (const auto &channel : event.channels) {
    cache_.set_guild_channel(channel);
    channels.insert(channel.id);
  }
  for (const auto &member : event.members) {
    cache_.set_member(member);
    members.insert(member.user.id);
  }
  for (const auto &presence : event.presences) {
    cache_.set_presence(presence);
    presences.insert(presence.user_id);
  }
  for (const auto &voice_state : event.voice_states) {
    cache_.set_voice_state(voice_state);
    voice_states.insert(voice_state.user_id);
  }

  if (auto record = cache_.get_guild_record(guild_id)) {
    for (const auto id : stale_keys(record->roles, roles))
      cache_.delete_role(id);
    for (const auto id : stale_keys(record->channels, channels))
      cache_.delete_guild_channel(id);
    for (const auto id : stale_keys(record->voice_states, voice_states))
      cache_.delete_voice_state(guild_id, id);
    for (const auto id : stale_keys(record->presences, presences))
      cache_.delete_presence(guild_id, id);
    for (const auto id : stale_keys(record->emojis, emojis))
      cache_.delete_emoji(id);
    for (const auto id : stale_keys(record->members, members))
      cache_.delete_member(guild_id, id);
  }

  GATEWAY_CACHE_LOG_DEBUG(
      "guild created",
      {id_field("guild_id", guild_id),
       int_field("members", static_cast<std::int64_t>(event.members.size()))});
}

void EventIngestor::handle(const GuildUpdateEvent &event) {
  const Snowflake guild_id = event.guild.id;
  known_guild(guild_id, "GUILD_UPDATE");
  cache_.update_guild(event.guild);

  cache_.clear_roles(guild_id);
  for (const auto &role : event.roles)
    cache_.set_role(role);

  handle(GuildEmojisUpdateEvent{guild_id, event.emojis});
}

void EventIngestor::handle(const GuildDeleteEvent &event) {
  if (event.unavailable) {
    ++stats_.guild_outages;
    cache_.set_guild_availability(event.guild_id, false);
    GATEWAY_CACHE_LOG_INFO("guild unavailable",
                           {id_field("guild_id", event.guild_id)});
    return;
  }
  cache_.purge_guild(event.guild_id);
}

void EventIngestor::handle(const GuildMemberAddEvent &event) {
  known_guild(event.member.guild_id, "GUILD_MEMBER_ADD");
  cache_.set_member(event.member);
}

void EventIngestor::handle(const GuildMemberUpdateEvent &event) {
  known_guild(event.member.guild_id, "GUILD_MEMBER_UPDATE");
  cache_.update_member(event.member);
}

void EventIngestor::handle(const GuildMemberRemoveEvent &event) {
  if (!known_guild(event.guild_id, "GUILD_MEMBER_REMOVE"))
    return;
  cache_.delete_member(event.guild_id, event.user.id);
}

void EventIngestor::handle(const GuildRoleCreateEvent &event) {
  known_guild(event.role.guild_id, "GUILD_ROLE_CREATE");
  cache_.set_role(event.role);
}

void EventIngestor::handle(const GuildRoleUpdateEvent &event) {
  known_guild(event.role.guild_id, "GUILD_ROLE_UPDATE");
  cache_.update_role(event.role);
}

void EventIngestor::handle(const GuildRoleDeleteEvent &event) {
  if (!known_guild(event.guild_id, "GUILD_ROLE_DELETE"))
    return;
  cache_.delete_role(event.role_id);
}

void EventIngestor::handle(const GuildEmojisUpdateEvent &event) {
  known_guild(event.guild_id, "GUILD_EMOJIS_UPDATE");

  // Set the new emojis before dropping the stale ones so creators shared by
  // both sets keep their reference throughout.
  std::unordered_set<Snowflake> current;
  for (const auto &emoji : event.emojis) {
    cache_.set_emoji(emoji);
    current.insert(emoji.id);
  }
  const auto record = cache_.get_guild_record(event.guild_id);
  if (!record.has_value())
    return;
  for (const auto emoji_id : stale_keys(record->emojis, current))
    cache_.delete_emoji(emoji_id);
}

void EventIngestor::put_channel(const Channel &channel) {
  if (const auto *guild_channel = std::get_if<GuildChannel>(&channel)) {
    cache_.update_guild_channel(*guild_channel);
    return;
  }
  cache_.update_dm_channel(std::get<DMChannel>(channel));
}

void EventIngestor::handle(const ChannelCreateEvent &event) {
  put_channel(event.channel);
}

void EventIngestor::handle(const ChannelUpdateEvent &event) {
  put_channel(event.channel);
}

void EventIngestor::handle(const ChannelDeleteEvent &event) {
  if (const auto *guild_channel = std::get_if<GuildChannel>(&event.channel)) {
    cache_.delete_guild_channel(guild_channel->id);
    return;
  }
  cache_.delete_dm_channel(std::get<DMChannel>(event.channel).recipient.id);
}

void EventIngestor::handle(const ChannelPinsUpdateEvent &event) {
  if (event.guild_id.has_value() &&
      !known_guild(*event.guild_id, "CHANNEL_PINS_UPDATE"))
    return;
  if (!cache_.update_last_pinned_timestamp(event.channel_id,
                                           event.last_pin_timestamp)) {
    GATEWAY_CACHE_LOG_DEBUG("pins update for uncached channel",
                            {id_field("channel_id", event.channel_id)});
  }
}

void EventIngestor::handle(const MessageCreateEvent &event) {
  cache_.set_message(event.message);
}

void EventIngestor::handle(const MessageUpdateEvent &event) {
  cache_.update_message(event.message);
}

void EventIngestor::handle(const MessageDeleteEvent &event) {
  cache_.delete_message(event.message_id);
}

void EventIngestor::handle(const PresenceUpdateEvent &event) {
  const auto &presence = event.presence;
  if (event.user.has_value() && cache_.get_user(event.user->id).has_value())
    cache_.update_user(*event.user);

  if (presence.visible_status == PresenceStatus::Offline) {
    cache_.delete_presence(presence.guild_id, presence.user_id);
    return;
  }
  cache_.update_presence(presence);
}

void EventIngestor::handle(const VoiceStateUpdateEvent &event) {
  const auto &voice_state = event.voice_state;
  if (!voice_state.channel_id.has_value()) {
    cache_.delete_voice_state(voice_state.guild_id, voice_state.user_id);
    return;
  }
  cache_.update_voice_state(voice_state);
}

void EventIngestor::handle(const UserUpdateEvent &event) {
  cache_.update_me(event.me);
}

bool EventIngestor::known_guild(Snowflake guild_id, const char *event_name) {
  if (cache_.get_guild_record(guild_id).has_value())
    return true;
  ++stats_.unknown_guild;
  GATEWAY_CACHE_LOG_WARN("event for unknown guild",
                         {string_field("event", event_name),
                          id_field("guild_id", guild_id)});
  return false;
}

} // namespace gateway_cache
