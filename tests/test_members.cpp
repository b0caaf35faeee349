#include "gateway_cache/cache.hpp"

#include "fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace gateway_cache;
using namespace gateway_cache::test;

TEST_CASE("Member round trips through the cache", "[members]") {
  Cache cache;
  const auto member = make_member(1, make_user(2));
  cache.set_member(member);

  auto got = cache.get_member(1, 2);
  REQUIRE(got.has_value());
  CHECK(*got == member);
  CHECK(cache.get_user(2).has_value());
  CHECK(cache.get_user_reference_count(2) == 1);
  CHECK(cache.get_guild_record(1)->user_references == 1);
  CHECK_FALSE(cache.get_member(1, 3).has_value());
  CHECK_FALSE(cache.get_member(9, 2).has_value());
}

TEST_CASE("Replacing a member keeps a single reference", "[members][refcount]") {
  Cache cache;
  auto member = make_member(1, make_user(2, "before"));
  cache.set_member(member);
  member.user.username = "after";
  member.nickname = "new nick";

  auto [old, now] = cache.update_member(member);
  REQUIRE(old.has_value());
  REQUIRE(now.has_value());
  CHECK(old->user.username == "before");
  CHECK(now->user.username == "after");
  CHECK(now->nickname == "new nick");
  CHECK(cache.get_user_reference_count(2) == 1);
}

TEST_CASE("Deleting the last member collects user and record",
          "[members][refcount]") {
  Cache cache;
  cache.set_member(make_member(1, make_user(2)));

  auto deleted = cache.delete_member(1, 2);
  REQUIRE(deleted.has_value());
  CHECK(deleted->user.id == 2);
  CHECK_FALSE(cache.get_user(2).has_value());
  CHECK_FALSE(cache.get_guild_record(1).has_value());
  CHECK_FALSE(cache.delete_member(1, 2).has_value());
}

TEST_CASE("Shared user survives one membership ending", "[members][refcount]") {
  Cache cache;
  const auto user = make_user(2);
  cache.set_guild(make_guild(1));
  cache.set_guild(make_guild(3));
  cache.set_member(make_member(1, user));
  cache.set_member(make_member(3, user));

  cache.delete_member(1, 2);
  CHECK(cache.get_user(2).has_value());
  CHECK(cache.get_user_reference_count(2) == 1);
  REQUIRE(cache.get_guild_record(1).has_value());
  CHECK(cache.get_guild_record(1)->user_references == 0);
}

TEST_CASE("Members whose user is gone are left out of views",
          "[members][views]") {
  Cache cache;
  cache.set_member(make_member(1, make_user(2)));
  cache.set_member(make_member(1, make_user(3)));
  cache.delete_user(3);

  auto view = cache.get_members_view(1);
  CHECK(view.size() == 1);
  CHECK(view.contains(2));
  CHECK_FALSE(cache.get_member(1, 3).has_value());
  CHECK(cache.stats().unresolved_records >= 1);
}

TEST_CASE("Clear members releases every user", "[members][refcount]") {
  Cache cache;
  cache.set_guild(make_guild(1));
  cache.set_member(make_member(1, make_user(2)));
  cache.set_member(make_member(1, make_user(3)));

  auto cleared = cache.clear_members(1);
  CHECK(cleared.size() == 2);
  CHECK(cache.get_members_view(1).empty());
  CHECK(cache.get_users_view().empty());
  CHECK(cache.get_guild(1).has_value());
}
