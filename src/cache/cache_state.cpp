#include "gateway_cache/cache_state.hpp"

#include "gateway_cache/errors.hpp"
#include "gateway_cache/logging.hpp"

#include <sstream>

namespace gateway_cache {

CacheState::CacheState(CacheConfig cfg)
    : cfg_(std::move(cfg)), dm_channels_(cfg_.dm_channel_capacity),
      messages_(cfg_.message_capacity) {}

void CacheState::set_me(const OwnUser &me) { me_ = me; }

std::optional<OwnUser> CacheState::delete_me() {
  auto me = std::move(me_);
  me_.reset();
  return me;
}

Change<OwnUser> CacheState::update_me(const OwnUser &me) {
  auto old = me_;
  set_me(me);
  return {std::move(old), me_};
}

std::optional<User> CacheState::get_user(Snowflake user_id) const {
  return users_.get(user_id);
}

std::unordered_map<Snowflake, User> CacheState::get_users_view() const {
  return users_.view();
}

void CacheState::set_user(const User &user) { users_.set(user); }

std::optional<User> CacheState::delete_user(Snowflake user_id) {
  return users_.erase(user_id);
}

Change<User> CacheState::update_user(const User &user) {
  return users_.update(user);
}

std::unordered_map<Snowflake, User> CacheState::clear_users() {
  return users_.clear();
}

std::size_t CacheState::get_user_reference_count(Snowflake user_id) const {
  return users_.reference_count(user_id);
}

const GuildRecord *CacheState::get_guild_record(Snowflake guild_id) const {
  return find_record(guild_id);
}

GuildRecord &CacheState::get_or_create_guild_record(Snowflake guild_id) {
  return guilds_[guild_id];
}

std::optional<Guild> CacheState::get_guild(Snowflake guild_id) const {
  const auto *record = find_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  if (record->is_available.has_value() && !*record->is_available)
    throw UnavailableGuildError(guild_id);
  return record->guild;
}

std::unordered_map<Snowflake, Guild> CacheState::get_guilds_view() const {
  std::unordered_map<Snowflake, Guild> out;
  for (const auto &[id, record] : guilds_) {
    if (!record.guild.has_value())
      continue;
    if (record.is_available.has_value() && !*record.is_available)
      continue;
    out.emplace(id, *record.guild);
  }
  return out;
}

void CacheState::set_guild(const Guild &guild) {
  auto &record = get_or_create_guild_record(guild.id);
  record.guild = guild;
  record.is_available = true;
}

std::optional<Guild> CacheState::delete_guild(Snowflake guild_id) {
  auto it = guilds_.find(guild_id);
  if (it == guilds_.end() || !it->second.guild.has_value())
    return std::nullopt;

  auto guild = std::move(it->second.guild);
  it->second.guild.reset();
  it->second.is_available.reset();
  if (it->second.empty())
    guilds_.erase(it);
  return guild;
}

Change<Guild> CacheState::update_guild(const Guild &guild) {
  std::optional<Guild> old;
  if (const auto *record = find_record(guild.id))
    old = record->guild;
  set_guild(guild);
  return {std::move(old), find_record(guild.id)->guild};
}

void CacheState::set_guild_availability(Snowflake guild_id, bool is_available) {
  get_or_create_guild_record(guild_id).is_available = is_available;
}

void CacheState::set_initial_unavailable_guilds(
    const std::vector<Snowflake> &guild_ids) {
  for (const auto id : guild_ids)
    set_guild_availability(id, false);
}

std::unordered_map<Snowflake, Guild> CacheState::clear_guilds() {
  std::unordered_map<Snowflake, Guild> out;
  for (auto it = guilds_.begin(); it != guilds_.end();) {
    auto &record = it->second;
    if (!record.guild.has_value()) {
      ++it;
      continue;
    }
    out.emplace(it->first, std::move(*record.guild));
    record.guild.reset();
    record.is_available.reset();
    if (record.empty())
      it = guilds_.erase(it);
    else
      ++it;
  }
  return out;
}

std::optional<Guild> CacheState::purge_guild(Snowflake guild_id) {
  auto it = guilds_.find(guild_id);
  if (it == guilds_.end())
    return std::nullopt;

  GuildRecord record = std::move(it->second);
  guilds_.erase(it);

  for (const auto &[user_id, member] : record.members)
    users_.release(user_id);
  for (const auto &[user_id, voice_state] : record.voice_states)
    users_.release(user_id);
  for (const auto &[emoji_id, emoji] : record.emojis) {
    emoji_guilds_.erase(emoji_id);
    if (emoji.user_id.has_value())
      users_.release(*emoji.user_id);
  }
  for (const auto &[role_id, role] : record.roles)
    role_guilds_.erase(role_id);
  for (const auto &[channel_id, channel] : record.channels)
    channel_guilds_.erase(channel_id);

  ++counters_.guild_purges;
  GATEWAY_CACHE_LOG_DEBUG(
      "guild purged",
      {id_field("guild_id", guild_id),
       int_field("members", static_cast<std::int64_t>(record.members.size())),
       int_field("channels",
                 static_cast<std::int64_t>(record.channels.size()))});
  return std::move(record.guild);
}

CacheStats CacheState::stats() const {
  CacheStats s;
  s.users = users_.size();
  s.referenced_users = users_.referenced_size();
  s.guild_records = guilds_.size();
  for (const auto &[id, record] : guilds_) {
    if (record.guild.has_value())
      ++s.guilds;
    if (record.is_available.has_value() && !*record.is_available)
      ++s.unavailable_guilds;
    s.members += record.members.size();
    s.voice_states += record.voice_states.size();
    s.roles += record.roles.size();
    s.emojis += record.emojis.size();
    s.guild_channels += record.channels.size();
    s.presences += record.presences.size();
  }
  s.dm_channels = dm_channels_.size();
  s.messages = messages_.size();
  s.dm_channel_evictions = dm_channels_.stats().evictions;
  s.message_evictions = messages_.stats().evictions;
  s.unresolved_records = counters_.unresolved_records.load();
  s.guild_purges = counters_.guild_purges.load();
  return s;
}

std::string CacheState::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "users:" << s.users << "\n";
  os << "referenced_users:" << s.referenced_users << "\n";
  os << "guild_records:" << s.guild_records << "\n";
  os << "guilds:" << s.guilds << "\n";
  os << "unavailable_guilds:" << s.unavailable_guilds << "\n";
  os << "members:" << s.members << "\n";
  os << "voice_states:" << s.voice_states << "\n";
  os << "roles:" << s.roles << "\n";
  os << "emojis:" << s.emojis << "\n";
  os << "guild_channels:" << s.guild_channels << "\n";
  os << "presences:" << s.presences << "\n";
  os << "dm_channels:" << s.dm_channels << "/" << dm_channels_.capacity()
     << "\n";
  os << "messages:" << s.messages << "/" << messages_.capacity() << "\n";
  os << "dm_channel_evictions:" << s.dm_channel_evictions << "\n";
  os << "message_evictions:" << s.message_evictions << "\n";
  os << "unresolved_records:" << s.unresolved_records << "\n";
  os << "guild_purges:" << s.guild_purges << "\n";
  os << "own_user:" << (me_.has_value() ? std::to_string(me_->id) : "none")
     << "\n";
  return os.str();
}

GuildRecord *CacheState::find_record(Snowflake guild_id) {
  auto it = guilds_.find(guild_id);
  if (it == guilds_.end())
    return nullptr;
  return &it->second;
}

const GuildRecord *CacheState::find_record(Snowflake guild_id) const {
  auto it = guilds_.find(guild_id);
  if (it == guilds_.end())
    return nullptr;
  return &it->second;
}

void CacheState::collect_if_empty(Snowflake guild_id) {
  auto it = guilds_.find(guild_id);
  if (it == guilds_.end())
    return;
  if (it->second.empty() && !it->second.is_available.has_value())
    guilds_.erase(it);
}

void CacheState::acquire_user(GuildRecord &record, const User &user) {
  users_.acquire(user);
  ++record.user_references;
}

void CacheState::acquire_user(GuildRecord &record, Snowflake user_id) {
  users_.acquire(user_id);
  ++record.user_references;
}

void CacheState::release_user(GuildRecord &record, Snowflake user_id) {
  if (record.user_references > 0)
    --record.user_references;
  users_.release(user_id);
}

} // namespace gateway_cache
