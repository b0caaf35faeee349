#include "gateway_cache/cache_state.hpp"

#include "gateway_cache/logging.hpp"
#include "gateway_cache/views.hpp"

namespace gateway_cache {

// DM channels --------------------------------------------------------------

std::optional<DMChannel> CacheState::get_dm_channel(Snowflake recipient_id) {
  const auto *data = dm_channels_.get(recipient_id);
  if (data == nullptr)
    return std::nullopt;
  auto channel = build_dm_channel(*data, users_);
  if (!channel.has_value())
    ++counters_.unresolved_records;
  return channel;
}

std::unordered_map<Snowflake, DMChannel>
CacheState::get_dm_channels_view() const {
  std::unordered_map<Snowflake, DMChannel> out;
  dm_channels_.for_each([&](Snowflake recipient_id, const DMChannelData &data) {
    if (auto channel = build_dm_channel(data, users_))
      out.emplace(recipient_id, std::move(*channel));
    else
      ++counters_.unresolved_records;
  });
  return out;
}

void CacheState::set_dm_channel(const DMChannel &channel) {
  const Snowflake recipient_id = channel.recipient.id;
  users_.acquire(channel.recipient);
  const bool existed = dm_channels_.contains(recipient_id);

  if (existed)
    forget_dm_channel(*dm_channels_.peek(recipient_id));

  auto evicted = dm_channels_.put(recipient_id, to_dm_channel_data(channel));
  dm_channel_recipients_[channel.id] = recipient_id;
  // The replaced record held a reference on the same recipient.
  if (existed)
    users_.release(recipient_id);
  if (evicted.has_value()) {
    GATEWAY_CACHE_LOG_DEBUG("dm channel evicted",
                            {id_field("channel_id", evicted->second.id),
                             id_field("recipient_id", evicted->first)});
    forget_dm_channel(evicted->second);
    users_.release(evicted->second.recipient_id);
  }
}

std::optional<DMChannel> CacheState::delete_dm_channel(Snowflake recipient_id) {
  auto data = dm_channels_.erase(recipient_id);
  if (!data.has_value())
    return std::nullopt;
  auto channel = build_dm_channel(*data, users_);
  forget_dm_channel(*data);
  users_.release(data->recipient_id);
  return channel;
}

Change<DMChannel> CacheState::update_dm_channel(const DMChannel &channel) {
  auto old = get_dm_channel(channel.recipient.id);
  set_dm_channel(channel);
  return {std::move(old), get_dm_channel(channel.recipient.id)};
}

std::unordered_map<Snowflake, DMChannel> CacheState::clear_dm_channels() {
  std::unordered_map<Snowflake, DMChannel> out;
  for (auto &[recipient_id, data] : dm_channels_.drain()) {
    if (auto channel = build_dm_channel(data, users_))
      out.emplace(recipient_id, std::move(*channel));
    users_.release(data.recipient_id);
  }
  dm_channel_recipients_.clear();
  return out;
}

void CacheState::forget_dm_channel(const DMChannelData &data) {
  auto it = dm_channel_recipients_.find(data.id);
  if (it != dm_channel_recipients_.end() && it->second == data.recipient_id)
    dm_channel_recipients_.erase(it);
}

// Messages -----------------------------------------------------------------

std::optional<Message> CacheState::get_message(Snowflake message_id) {
  const auto *data = messages_.get(message_id);
  if (data == nullptr)
    return std::nullopt;
  auto message = build_message(*data, users_);
  if (!message.has_value())
    ++counters_.unresolved_records;
  return message;
}

std::unordered_map<Snowflake, Message> CacheState::get_messages_view() const {
  std::unordered_map<Snowflake, Message> out;
  messages_.for_each([&](Snowflake message_id, const MessageData &data) {
    if (auto message = build_message(data, users_))
      out.emplace(message_id, std::move(*message));
    else
      ++counters_.unresolved_records;
  });
  return out;
}

void CacheState::set_message(const Message &message) {
  users_.acquire(message.author);

  std::optional<Snowflake> previous_author;
  if (const auto *previous = messages_.peek(message.id))
    previous_author = previous->author_id;

  auto evicted = messages_.put(message.id, to_message_data(message));
  if (previous_author.has_value())
    users_.release(*previous_author);
  if (evicted.has_value()) {
    GATEWAY_CACHE_LOG_DEBUG(
        "message evicted",
        {id_field("message_id", evicted->first),
         id_field("channel_id", evicted->second.channel_id)});
    users_.release(evicted->second.author_id);
  }

  advance_last_message_id(message.channel_id, message.id);
}

std::optional<Message> CacheState::delete_message(Snowflake message_id) {
  auto data = messages_.erase(message_id);
  if (!data.has_value())
    return std::nullopt;
  auto message = build_message(*data, users_);
  users_.release(data->author_id);
  return message;
}

Change<Message> CacheState::update_message(const Message &message) {
  auto old = get_message(message.id);
  set_message(message);
  return {std::move(old), get_message(message.id)};
}

std::unordered_map<Snowflake, Message> CacheState::clear_messages() {
  std::unordered_map<Snowflake, Message> out;
  for (auto &[message_id, data] : messages_.drain()) {
    if (auto message = build_message(data, users_))
      out.emplace(message_id, std::move(*message));
    users_.release(data.author_id);
  }
  return out;
}

// Moves the channel's last_message_id forward, never back. Covers cached
// guild channels and cached DM channels.
void CacheState::advance_last_message_id(Snowflake channel_id,
                                         Snowflake message_id) {
  std::optional<Snowflake> *last = nullptr;
  if (auto idx = channel_guilds_.find(channel_id);
      idx != channel_guilds_.end()) {
    if (auto *record = find_record(idx->second)) {
      auto it = record->channels.find(channel_id);
      if (it != record->channels.end())
        last = &it->second.last_message_id;
    }
  } else if (auto dm = dm_channel_recipients_.find(channel_id);
             dm != dm_channel_recipients_.end()) {
    if (auto *data = dm_channels_.peek(dm->second))
      last = &data->last_message_id;
  }
  if (last == nullptr)
    return;
  if (!last->has_value() || **last < message_id)
    *last = message_id;
}

} // namespace gateway_cache
