#include "gateway_cache/views.hpp"

#include "fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace gateway_cache;
using namespace gateway_cache::test;

TEST_CASE("DM channel record keeps only the recipient id", "[views][dm]") {
  auto channel = make_dm_channel(5642134, make_user(2342344));
  channel.name = "dm";
  channel.last_message_id = 42;

  const auto data = to_dm_channel_data(channel);
  CHECK(data.id == 5642134);
  CHECK(data.recipient_id == 2342344);
  CHECK(data.last_message_id == 42);

  UserStore users;
  CHECK_FALSE(build_dm_channel(data, users).has_value());
  users.set(make_user(2342344));
  auto rebuilt = build_dm_channel(data, users);
  REQUIRE(rebuilt.has_value());
  CHECK(*rebuilt == channel);
}

TEST_CASE("Member rebuilds with the current user", "[views][members]") {
  UserStore users;
  const auto member = make_member(10, make_user(20, "old"));
  const auto data = to_member_data(member);
  CHECK(data.id == 20);

  users.set(make_user(20, "renamed"));
  auto rebuilt = build_member(data, users);
  REQUIRE(rebuilt.has_value());
  CHECK(rebuilt->user.username == "renamed");
  CHECK(rebuilt->nickname == member.nickname);
  CHECK(rebuilt->role_ids == member.role_ids);
}

TEST_CASE("Emoji without creator needs no user", "[views][emojis]") {
  UserStore users;
  const auto anonymous = make_emoji(1, 2, std::nullopt);
  auto rebuilt = build_emoji(to_emoji_data(anonymous), users);
  REQUIRE(rebuilt.has_value());
  CHECK(*rebuilt == anonymous);

  const auto created = make_emoji(1, 3, make_user(9));
  CHECK_FALSE(build_emoji(to_emoji_data(created), users).has_value());
}

TEST_CASE("Voice state carries the supplied member", "[views][voice]") {
  const auto voice_state = make_voice_state(1, 2, make_user(3));
  const auto data = to_voice_state_data(voice_state);
  CHECK(data.user_id == 3);

  auto rebuilt = build_voice_state(data, voice_state.member);
  CHECK(rebuilt == voice_state);
  CHECK_FALSE(build_voice_state(data, std::nullopt).member.has_value());
}

TEST_CASE("Message rebuilds around its author", "[views][messages]") {
  UserStore users;
  users.set(make_user(5));
  auto message = make_message(100, 200, make_user(5));
  message.guild_id = 300;
  message.user_mentions = {5};

  auto rebuilt = build_message(to_message_data(message), users);
  REQUIRE(rebuilt.has_value());
  CHECK(*rebuilt == message);
}
