#include "gateway_cache/views.hpp"

#include <utility>

namespace gateway_cache {

DMChannelData to_dm_channel_data(const DMChannel &channel) {
  DMChannelData data;
  data.id = channel.id;
  data.name = channel.name;
  data.last_message_id = channel.last_message_id;
  data.recipient_id = channel.recipient.id;
  return data;
}

MemberData to_member_data(const Member &member) {
  MemberData data;
  data.id = member.user.id;
  data.guild_id = member.guild_id;
  data.nickname = member.nickname;
  data.role_ids = member.role_ids;
  data.joined_at = member.joined_at;
  data.premium_since = member.premium_since;
  data.is_deaf = member.is_deaf;
  data.is_mute = member.is_mute;
  return data;
}

VoiceStateData to_voice_state_data(const VoiceState &voice_state) {
  VoiceStateData data;
  data.channel_id = voice_state.channel_id;
  data.guild_id = voice_state.guild_id;
  data.is_guild_deafened = voice_state.is_guild_deafened;
  data.is_guild_muted = voice_state.is_guild_muted;
  data.is_self_deafened = voice_state.is_self_deafened;
  data.is_self_muted = voice_state.is_self_muted;
  data.is_streaming = voice_state.is_streaming;
  data.is_suppressed = voice_state.is_suppressed;
  data.is_video_enabled = voice_state.is_video_enabled;
  data.user_id = voice_state.user_id;
  data.session_id = voice_state.session_id;
  return data;
}

KnownCustomEmojiData to_emoji_data(const KnownCustomEmoji &emoji) {
  KnownCustomEmojiData data;
  data.id = emoji.id;
  data.guild_id = emoji.guild_id;
  data.name = emoji.name;
  data.is_animated = emoji.is_animated;
  data.role_ids = emoji.role_ids;
  if (emoji.user.has_value())
    data.user_id = emoji.user->id;
  data.is_colons_required = emoji.is_colons_required;
  data.is_managed = emoji.is_managed;
  data.is_available = emoji.is_available;
  return data;
}

MessageData to_message_data(const Message &message) {
  MessageData data;
  data.id = message.id;
  data.channel_id = message.channel_id;
  data.guild_id = message.guild_id;
  data.author_id = message.author.id;
  data.content = message.content;
  data.timestamp = message.timestamp;
  data.edited_timestamp = message.edited_timestamp;
  data.is_tts = message.is_tts;
  data.is_mentioning_everyone = message.is_mentioning_everyone;
  data.user_mentions = message.user_mentions;
  data.role_mentions = message.role_mentions;
  data.is_pinned = message.is_pinned;
  data.webhook_id = message.webhook_id;
  data.type = message.type;
  return data;
}

std::optional<DMChannel> build_dm_channel(const DMChannelData &data,
                                          const UserStore &users) {
  const User *recipient = users.find(data.recipient_id);
  if (recipient == nullptr)
    return std::nullopt;

  DMChannel channel;
  channel.id = data.id;
  channel.type = ChannelType::DM;
  channel.name = data.name;
  channel.last_message_id = data.last_message_id;
  channel.recipient = *recipient;
  return channel;
}

std::optional<Member> build_member(const MemberData &data,
                                   const UserStore &users) {
  const User *user = users.find(data.id);
  if (user == nullptr)
    return std::nullopt;

  Member member;
  member.user = *user;
  member.guild_id = data.guild_id;
  member.nickname = data.nickname;
  member.role_ids = data.role_ids;
  member.joined_at = data.joined_at;
  member.premium_since = data.premium_since;
  member.is_deaf = data.is_deaf;
  member.is_mute = data.is_mute;
  return member;
}

VoiceState build_voice_state(const VoiceStateData &data,
                             std::optional<Member> member) {
  VoiceState voice_state;
  voice_state.guild_id = data.guild_id;
  voice_state.channel_id = data.channel_id;
  voice_state.user_id = data.user_id;
  voice_state.member = std::move(member);
  voice_state.session_id = data.session_id;
  voice_state.is_guild_deafened = data.is_guild_deafened;
  voice_state.is_guild_muted = data.is_guild_muted;
  voice_state.is_self_deafened = data.is_self_deafened;
  voice_state.is_self_muted = data.is_self_muted;
  voice_state.is_streaming = data.is_streaming;
  voice_state.is_suppressed = data.is_suppressed;
  voice_state.is_video_enabled = data.is_video_enabled;
  return voice_state;
}

std::optional<KnownCustomEmoji> build_emoji(const KnownCustomEmojiData &data,
                                            const UserStore &users) {
  KnownCustomEmoji emoji;
  if (data.user_id.has_value()) {
    const User *user = users.find(*data.user_id);
    if (user == nullptr)
      return std::nullopt;
    emoji.user = *user;
  }
  emoji.id = data.id;
  emoji.guild_id = data.guild_id;
  emoji.name = data.name;
  emoji.is_animated = data.is_animated;
  emoji.role_ids = data.role_ids;
  emoji.is_colons_required = data.is_colons_required;
  emoji.is_managed = data.is_managed;
  emoji.is_available = data.is_available;
  return emoji;
}

std::optional<Message> build_message(const MessageData &data,
                                     const UserStore &users) {
  const User *author = users.find(data.author_id);
  if (author == nullptr)
    return std::nullopt;

  Message message;
  message.id = data.id;
  message.channel_id = data.channel_id;
  message.guild_id = data.guild_id;
  message.author = *author;
  message.content = data.content;
  message.timestamp = data.timestamp;
  message.edited_timestamp = data.edited_timestamp;
  message.is_tts = data.is_tts;
  message.is_mentioning_everyone = data.is_mentioning_everyone;
  message.user_mentions = data.user_mentions;
  message.role_mentions = data.role_mentions;
  message.is_pinned = data.is_pinned;
  message.webhook_id = data.webhook_id;
  message.type = data.type;
  return message;
}

} // namespace gateway_cache
