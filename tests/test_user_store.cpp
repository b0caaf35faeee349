#include "gateway_cache/user_store.hpp"

#include "fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace gateway_cache;
using namespace gateway_cache::test;

TEST_CASE("Users are inserted, replaced and erased", "[users]") {
  UserStore users;
  CHECK_FALSE(users.get(1).has_value());

  users.set(make_user(1, "first"));
  REQUIRE(users.get(1).has_value());
  CHECK(users.get(1)->username == "first");

  auto [old, now] = users.update(make_user(1, "second"));
  REQUIRE(old.has_value());
  REQUIRE(now.has_value());
  CHECK(old->username == "first");
  CHECK(now->username == "second");

  auto erased = users.erase(1);
  REQUIRE(erased.has_value());
  CHECK(erased->username == "second");
  CHECK_FALSE(users.contains(1));
  CHECK_FALSE(users.erase(1).has_value());
}

TEST_CASE("Last release collects the user", "[users][refcount]") {
  UserStore users;
  users.acquire(make_user(7));
  users.acquire(make_user(7));
  CHECK(users.reference_count(7) == 2);

  CHECK_FALSE(users.release(7));
  CHECK(users.contains(7));
  CHECK(users.reference_count(7) == 1);

  CHECK(users.release(7));
  CHECK_FALSE(users.contains(7));
  CHECK(users.reference_count(7) == 0);
  CHECK(users.referenced_size() == 0);
  CHECK(users.stats().collected == 1);
}

TEST_CASE("Release without a reference is counted, not fatal",
          "[users][refcount]") {
  UserStore users;
  users.set(make_user(3));
  CHECK_FALSE(users.release(3));
  CHECK(users.stats().underflows == 1);
  CHECK(users.contains(3));
}

TEST_CASE("Set keeps reference counts and clear keeps counters",
          "[users][refcount]") {
  UserStore users;
  users.acquire(make_user(4, "a"));
  users.set(make_user(4, "b"));
  CHECK(users.reference_count(4) == 1);
  CHECK(users.get(4)->username == "b");

  auto cleared = users.clear();
  CHECK(cleared.size() == 1);
  CHECK(users.size() == 0);
  CHECK(users.reference_count(4) == 1);
  CHECK(users.release(4));
}
