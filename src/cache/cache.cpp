#include "gateway_cache/cache.hpp"

#include <mutex>

namespace gateway_cache {

Cache::Cache(CacheConfig cfg) : state_(std::move(cfg)) {}

std::optional<GuildRecord> Cache::get_guild_record(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  const auto *record = state_.get_guild_record(guild_id);
  if (record == nullptr)
    return std::nullopt;
  return *record;
}

GuildRecord Cache::get_or_create_guild_record(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.get_or_create_guild_record(guild_id);
}

std::optional<OwnUser> Cache::get_me() const {
  std::shared_lock lock(mutex_);
  return state_.get_me();
}

void Cache::set_me(const OwnUser &me) {
  std::unique_lock lock(mutex_);
  state_.set_me(me);
}

std::optional<OwnUser> Cache::delete_me() {
  std::unique_lock lock(mutex_);
  return state_.delete_me();
}

Change<OwnUser> Cache::update_me(const OwnUser &me) {
  std::unique_lock lock(mutex_);
  return state_.update_me(me);
}

std::optional<User> Cache::get_user(Snowflake user_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_user(user_id);
}

std::unordered_map<Snowflake, User> Cache::get_users_view() const {
  std::shared_lock lock(mutex_);
  return state_.get_users_view();
}

void Cache::set_user(const User &user) {
  std::unique_lock lock(mutex_);
  state_.set_user(user);
}

std::optional<User> Cache::delete_user(Snowflake user_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_user(user_id);
}

Change<User> Cache::update_user(const User &user) {
  std::unique_lock lock(mutex_);
  return state_.update_user(user);
}

std::unordered_map<Snowflake, User> Cache::clear_users() {
  std::unique_lock lock(mutex_);
  return state_.clear_users();
}

std::size_t Cache::get_user_reference_count(Snowflake user_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_user_reference_count(user_id);
}

std::optional<Guild> Cache::get_guild(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_guild(guild_id);
}

std::unordered_map<Snowflake, Guild> Cache::get_guilds_view() const {
  std::shared_lock lock(mutex_);
  return state_.get_guilds_view();
}

void Cache::set_guild(const Guild &guild) {
  std::unique_lock lock(mutex_);
  state_.set_guild(guild);
}

std::optional<Guild> Cache::delete_guild(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_guild(guild_id);
}

Change<Guild> Cache::update_guild(const Guild &guild) {
  std::unique_lock lock(mutex_);
  return state_.update_guild(guild);
}

void Cache::set_guild_availability(Snowflake guild_id, bool is_available) {
  std::unique_lock lock(mutex_);
  state_.set_guild_availability(guild_id, is_available);
}

void
Cache::set_initial_unavailable_guilds(const std::vector<Snowflake> &guild_ids) {
  std::unique_lock lock(mutex_);
  state_.set_initial_unavailable_guilds(guild_ids);
}

std::unordered_map<Snowflake, Guild> Cache::clear_guilds() {
  std::unique_lock lock(mutex_);
  return state_.clear_guilds();
}

std::optional<Guild> Cache::purge_guild(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.purge_guild(guild_id);
}

std::size_t Cache::guild_record_count() const {
  std::shared_lock lock(mutex_);
  return state_.guild_record_count();
}

std::optional<Member>
Cache::get_member(Snowflake guild_id, Snowflake user_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_member(guild_id, user_id);
}

std::unordered_map<Snowflake, Member>
Cache::get_members_view(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_members_view(guild_id);
}

void Cache::set_member(const Member &member) {
  std::unique_lock lock(mutex_);
  state_.set_member(member);
}

std::optional<Member>
Cache::delete_member(Snowflake guild_id, Snowflake user_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_member(guild_id, user_id);
}

Change<Member> Cache::update_member(const Member &member) {
  std::unique_lock lock(mutex_);
  return state_.update_member(member);
}

std::unordered_map<Snowflake, Member> Cache::clear_members(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.clear_members(guild_id);
}

std::optional<VoiceState>
Cache::get_voice_state(Snowflake guild_id, Snowflake user_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_voice_state(guild_id, user_id);
}

std::unordered_map<Snowflake, VoiceState>
Cache::get_voice_states_view(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_voice_states_view(guild_id);
}

std::unordered_map<Snowflake, VoiceState>
Cache::get_voice_states_view_for_channel(Snowflake guild_id,
                                         Snowflake channel_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_voice_states_view_for_channel(guild_id, channel_id);
}

void Cache::set_voice_state(const VoiceState &voice_state) {
  std::unique_lock lock(mutex_);
  state_.set_voice_state(voice_state);
}

std::optional<VoiceState>
Cache::delete_voice_state(Snowflake guild_id, Snowflake user_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_voice_state(guild_id, user_id);
}

Change<VoiceState> Cache::update_voice_state(const VoiceState &voice_state) {
  std::unique_lock lock(mutex_);
  return state_.update_voice_state(voice_state);
}

std::unordered_map<Snowflake, VoiceState>
Cache::clear_voice_states(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.clear_voice_states(guild_id);
}

std::optional<MemberPresence>
Cache::get_presence(Snowflake guild_id, Snowflake user_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_presence(guild_id, user_id);
}

std::unordered_map<Snowflake, MemberPresence>
Cache::get_presences_view(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_presences_view(guild_id);
}

void Cache::set_presence(const MemberPresence &presence) {
  std::unique_lock lock(mutex_);
  state_.set_presence(presence);
}

std::optional<MemberPresence>
Cache::delete_presence(Snowflake guild_id, Snowflake user_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_presence(guild_id, user_id);
}

Change<MemberPresence> Cache::update_presence(const MemberPresence &presence) {
  std::unique_lock lock(mutex_);
  return state_.update_presence(presence);
}

std::unordered_map<Snowflake, MemberPresence>
Cache::clear_presences(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.clear_presences(guild_id);
}

std::optional<Role> Cache::get_role(Snowflake role_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_role(role_id);
}

std::unordered_map<Snowflake, Role>
Cache::get_roles_view(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_roles_view(guild_id);
}

void Cache::set_role(const Role &role) {
  std::unique_lock lock(mutex_);
  state_.set_role(role);
}

std::optional<Role> Cache::delete_role(Snowflake role_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_role(role_id);
}

Change<Role> Cache::update_role(const Role &role) {
  std::unique_lock lock(mutex_);
  return state_.update_role(role);
}

std::unordered_map<Snowflake, Role> Cache::clear_roles(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.clear_roles(guild_id);
}

std::optional<KnownCustomEmoji> Cache::get_emoji(Snowflake emoji_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_emoji(emoji_id);
}

std::unordered_map<Snowflake, KnownCustomEmoji>
Cache::get_emojis_view(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_emojis_view(guild_id);
}

void Cache::set_emoji(const KnownCustomEmoji &emoji) {
  std::unique_lock lock(mutex_);
  state_.set_emoji(emoji);
}

std::optional<KnownCustomEmoji> Cache::delete_emoji(Snowflake emoji_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_emoji(emoji_id);
}

Change<KnownCustomEmoji> Cache::update_emoji(const KnownCustomEmoji &emoji) {
  std::unique_lock lock(mutex_);
  return state_.update_emoji(emoji);
}

std::unordered_map<Snowflake, KnownCustomEmoji>
Cache::clear_emojis(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.clear_emojis(guild_id);
}

std::optional<GuildChannel>
Cache::get_guild_channel(Snowflake channel_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_guild_channel(channel_id);
}

std::unordered_map<Snowflake, GuildChannel>
Cache::get_guild_channels_view(Snowflake guild_id) const {
  std::shared_lock lock(mutex_);
  return state_.get_guild_channels_view(guild_id);
}

void Cache::set_guild_channel(const GuildChannel &channel) {
  std::unique_lock lock(mutex_);
  state_.set_guild_channel(channel);
}

std::optional<GuildChannel> Cache::delete_guild_channel(Snowflake channel_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_guild_channel(channel_id);
}

Change<GuildChannel> Cache::update_guild_channel(const GuildChannel &channel) {
  std::unique_lock lock(mutex_);
  return state_.update_guild_channel(channel);
}

std::unordered_map<Snowflake, GuildChannel>
Cache::clear_guild_channels(Snowflake guild_id) {
  std::unique_lock lock(mutex_);
  return state_.clear_guild_channels(guild_id);
}

bool
Cache::update_last_pinned_timestamp(Snowflake channel_id,
                                    std::optional<TimePoint> timestamp) {
  std::unique_lock lock(mutex_);
  return state_.update_last_pinned_timestamp(channel_id, timestamp);
}

std::optional<DMChannel> Cache::get_dm_channel(Snowflake recipient_id) {
  std::unique_lock lock(mutex_);
  return state_.get_dm_channel(recipient_id);
}

std::unordered_map<Snowflake, DMChannel> Cache::get_dm_channels_view() const {
  std::shared_lock lock(mutex_);
  return state_.get_dm_channels_view();
}

void Cache::set_dm_channel(const DMChannel &channel) {
  std::unique_lock lock(mutex_);
  state_.set_dm_channel(channel);
}

std::optional<DMChannel> Cache::delete_dm_channel(Snowflake recipient_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_dm_channel(recipient_id);
}

Change<DMChannel> Cache::update_dm_channel(const DMChannel &channel) {
  std::unique_lock lock(mutex_);
  return state_.update_dm_channel(channel);
}

std::unordered_map<Snowflake, DMChannel> Cache::clear_dm_channels() {
  std::unique_lock lock(mutex_);
  return state_.clear_dm_channels();
}

std::optional<Message> Cache::get_message(Snowflake message_id) {
  std::unique_lock lock(mutex_);
  return state_.get_message(message_id);
}

std::unordered_map<Snowflake, Message> Cache::get_messages_view() const {
  std::shared_lock lock(mutex_);
  return state_.get_messages_view();
}

void Cache::set_message(const Message &message) {
  std::unique_lock lock(mutex_);
  state_.set_message(message);
}

std::optional<Message> Cache::delete_message(Snowflake message_id) {
  std::unique_lock lock(mutex_);
  return state_.delete_message(message_id);
}

Change<Message> Cache::update_message(const Message &message) {
  std::unique_lock lock(mutex_);
  return state_.update_message(message);
}

std::unordered_map<Snowflake, Message> Cache::clear_messages() {
  std::unique_lock lock(mutex_);
  return state_.clear_messages();
}

CacheStats Cache::stats() const {
  std::shared_lock lock(mutex_);
  return state_.stats();
}

std::string Cache::info() const {
  std::shared_lock lock(mutex_);
  return state_.info();
}

} // namespace gateway_cache
