#pragma once

#include "gateway_cache/entities.hpp"
#include "gateway_cache/records.hpp"
#include "gateway_cache/user_store.hpp"

#include <optional>

namespace gateway_cache {

// Write path: full entity -> compact record. Shared users are reduced to
// their ids.
DMChannelData to_dm_channel_data(const DMChannel &channel);
MemberData to_member_data(const Member &member);
VoiceStateData to_voice_state_data(const VoiceState &voice_state);
KnownCustomEmojiData to_emoji_data(const KnownCustomEmoji &emoji);
MessageData to_message_data(const Message &message);

// Read path: compact record + user lookup -> full entity. Each build_* is
// the left inverse of the matching to_*_data. An empty result means a
// referenced user is not cached; callers leave such records out of their
// views.
std::optional<DMChannel> build_dm_channel(const DMChannelData &data,
                                          const UserStore &users);
std::optional<Member> build_member(const MemberData &data,
                                   const UserStore &users);
// member is the already rebuilt member of the same user, if any.
VoiceState build_voice_state(const VoiceStateData &data,
                             std::optional<Member> member);
std::optional<KnownCustomEmoji> build_emoji(const KnownCustomEmojiData &data,
                                            const UserStore &users);
std::optional<Message> build_message(const MessageData &data,
                                     const UserStore &users);

} // namespace gateway_cache
