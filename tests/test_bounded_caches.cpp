#include "gateway_cache/cache.hpp"

#include "fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace gateway_cache;
using namespace gateway_cache::test;

namespace {

Cache small_cache(std::size_t dm_channels, std::size_t messages) {
  CacheConfig cfg;
  cfg.dm_channel_capacity = dm_channels;
  cfg.message_capacity = messages;
  return Cache(cfg);
}

} // namespace

TEST_CASE("DM channel is keyed by its recipient", "[dm]") {
  Cache cache;
  const auto channel = make_dm_channel(5642134, make_user(2342344));
  cache.set_dm_channel(channel);

  auto got = cache.get_dm_channel(2342344);
  REQUIRE(got.has_value());
  CHECK(*got == channel);
  CHECK_FALSE(cache.get_dm_channel(5642134).has_value());
  CHECK(cache.get_user_reference_count(2342344) == 1);

  auto deleted = cache.delete_dm_channel(2342344);
  REQUIRE(deleted.has_value());
  CHECK(deleted->id == 5642134);
  CHECK_FALSE(cache.get_user(2342344).has_value());
}

TEST_CASE("Replacing a DM channel keeps one reference", "[dm][refcount]") {
  Cache cache;
  cache.set_dm_channel(make_dm_channel(1, make_user(2)));
  auto replacement = make_dm_channel(1, make_user(2));
  replacement.last_message_id = 77;

  auto [old, now] = cache.update_dm_channel(replacement);
  REQUIRE(old.has_value());
  CHECK_FALSE(old->last_message_id.has_value());
  CHECK(now->last_message_id == 77);
  CHECK(cache.get_user_reference_count(2) == 1);
}

TEST_CASE("DM channel eviction releases the recipient", "[dm][lru]") {
  auto cache = small_cache(2, 10);
  cache.set_dm_channel(make_dm_channel(10, make_user(1)));
  cache.set_dm_channel(make_dm_channel(20, make_user(2)));
  REQUIRE(cache.get_dm_channel(1).has_value());
  cache.set_dm_channel(make_dm_channel(30, make_user(3)));

  CHECK(cache.get_dm_channels_view().size() == 2);
  CHECK_FALSE(cache.get_dm_channel(2).has_value());
  CHECK_FALSE(cache.get_user(2).has_value());
  CHECK(cache.get_user_reference_count(2) == 0);
  CHECK(cache.get_user(1).has_value());
  CHECK(cache.stats().dm_channel_evictions == 1);
}

TEST_CASE("Clear DM channels releases every recipient", "[dm]") {
  Cache cache;
  cache.set_dm_channel(make_dm_channel(10, make_user(1)));
  cache.set_dm_channel(make_dm_channel(20, make_user(2)));

  auto cleared = cache.clear_dm_channels();
  CHECK(cleared.size() == 2);
  CHECK(cleared.contains(1));
  CHECK(cache.get_users_view().empty());
  CHECK(cache.get_dm_channels_view().empty());
}

TEST_CASE("Messages hold a reference on their author", "[messages][refcount]") {
  Cache cache;
  const auto author = make_user(7);
  cache.set_message(make_message(100, 1, author));
  cache.set_message(make_message(101, 1, author));
  CHECK(cache.get_user_reference_count(7) == 2);

  auto got = cache.get_message(100);
  REQUIRE(got.has_value());
  CHECK(got->author == author);

  auto [old, now] = cache.update_message(make_message(100, 1, author, "edited"));
  CHECK(old->content == "hello");
  CHECK(now->content == "edited");
  CHECK(cache.get_user_reference_count(7) == 2);

  CHECK(cache.delete_message(100).has_value());
  CHECK(cache.clear_messages().size() == 1);
  CHECK_FALSE(cache.get_user(7).has_value());
}

TEST_CASE("Message author change moves the reference", "[messages][refcount]") {
  Cache cache;
  cache.set_message(make_message(100, 1, make_user(7)));
  cache.set_message(make_message(100, 1, make_user(8)));
  CHECK_FALSE(cache.get_user(7).has_value());
  CHECK(cache.get_user_reference_count(8) == 1);
}

TEST_CASE("Message eviction releases exactly one reference",
          "[messages][lru]") {
  auto cache = small_cache(10, 2);
  const auto author = make_user(7);
  cache.set_message(make_message(100, 1, author));
  cache.set_message(make_message(101, 1, author));
  cache.set_message(make_message(102, 1, author));

  CHECK_FALSE(cache.get_message(100).has_value());
  CHECK(cache.get_messages_view().size() == 2);
  CHECK(cache.get_user_reference_count(7) == 2);
  CHECK(cache.stats().message_evictions == 1);
}

TEST_CASE("Zero capacity never keeps a message or its author",
          "[messages][lru]") {
  auto cache = small_cache(10, 0);
  cache.set_message(make_message(100, 1, make_user(7)));
  CHECK_FALSE(cache.get_message(100).has_value());
  CHECK_FALSE(cache.get_user(7).has_value());
}

TEST_CASE("Messages advance the channel's last message id",
          "[messages][channels]") {
  Cache cache;
  cache.set_guild_channel(make_guild_channel(1, 30));
  cache.set_message(make_message(200, 30, make_user(7)));
  CHECK(cache.get_guild_channel(30)->last_message_id == 200);

  cache.set_message(make_message(150, 30, make_user(7)));
  CHECK(cache.get_guild_channel(30)->last_message_id == 200);

  cache.set_message(make_message(250, 99, make_user(7)));
  CHECK(cache.get_guild_channel(30)->last_message_id == 200);
}

TEST_CASE("Messages advance the DM channel's last message id",
          "[dm][messages]") {
  Cache cache;
  const auto recipient = make_user(2);
  cache.set_dm_channel(make_dm_channel(10, recipient));

  cache.set_message(make_message(500, 10, recipient));
  CHECK(cache.get_dm_channel(2)->last_message_id == Snowflake{500});

  // Never moves back.
  cache.set_message(make_message(400, 10, recipient));
  CHECK(cache.get_dm_channel(2)->last_message_id == Snowflake{500});

  // Messages in other channels leave it alone.
  cache.set_message(make_message(600, 11, recipient));
  CHECK(cache.get_dm_channel(2)->last_message_id == Snowflake{500});
}

TEST_CASE("DM channel index follows replace, eviction and clear",
          "[dm][messages][lru]") {
  auto cache = small_cache(1, 10);
  const auto first = make_user(1);
  const auto second = make_user(2);

  // Same recipient, new channel id: the old id no longer maps.
  cache.set_dm_channel(make_dm_channel(10, first));
  cache.set_dm_channel(make_dm_channel(11, first));
  cache.set_message(make_message(100, 10, first));
  CHECK_FALSE(cache.get_dm_channel(1)->last_message_id.has_value());
  cache.set_message(make_message(101, 11, first));
  CHECK(cache.get_dm_channel(1)->last_message_id == Snowflake{101});

  // Evicted by the next recipient; its channel id stops advancing anything.
  cache.set_dm_channel(make_dm_channel(20, second));
  REQUIRE_FALSE(cache.get_dm_channel(1).has_value());
  cache.set_message(make_message(102, 11, first));
  cache.set_message(make_message(103, 20, second));
  CHECK(cache.get_dm_channel(2)->last_message_id == Snowflake{103});

  cache.clear_dm_channels();
  cache.set_dm_channel(make_dm_channel(30, first));
  cache.set_message(make_message(104, 20, second));
  CHECK_FALSE(cache.get_dm_channel(1)->last_message_id.has_value());
}

TEST_CASE("Advancing a DM channel does not refresh its recency",
          "[dm][messages][lru]") {
  auto cache = small_cache(2, 10);
  cache.set_dm_channel(make_dm_channel(10, make_user(1)));
  cache.set_dm_channel(make_dm_channel(20, make_user(2)));
  cache.set_message(make_message(500, 10, make_user(3)));

  cache.set_dm_channel(make_dm_channel(30, make_user(4)));
  CHECK_FALSE(cache.get_dm_channel(1).has_value());
  CHECK(cache.get_dm_channel(2).has_value());
}
