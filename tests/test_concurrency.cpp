#include "gateway_cache/cache.hpp"

#include "fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace gateway_cache;
using namespace gateway_cache::test;

TEST_CASE("Const readers may share the cache", "[concurrency]") {
  Cache cache;
  for (Snowflake id = 1; id <= 50; ++id)
    cache.set_member(make_member(1, make_user(id)));
  // Two members whose users are gone; every view counts both.
  cache.delete_user(49);
  cache.delete_user(50);

  const Cache &reader = cache;
  constexpr int kThreads = 4;
  constexpr int kRounds = 200;
  std::atomic<int> short_views{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kRounds; ++i) {
        if (reader.get_members_view(1).size() != 48)
          ++short_views;
      }
    });
  }
  for (auto &thread : threads)
    thread.join();

  CHECK(short_views.load() == 0);
  CHECK(cache.stats().unresolved_records == 2u * kThreads * kRounds);
}

TEST_CASE("Readers run alongside a writer", "[concurrency]") {
  Cache cache;
  cache.set_guild(make_guild(1));
  std::atomic<bool> done{false};

  std::thread writer([&] {
    for (Snowflake id = 1; id <= 500; ++id) {
      cache.set_member(make_member(1, make_user(id)));
      cache.set_message(make_message(id, 30, make_user(id)));
      if (id % 3 == 0)
        cache.delete_member(1, id);
    }
    done = true;
  });

  std::size_t max_seen = 0;
  int mismatched = 0;
  while (!done) {
    auto members = cache.get_members_view(1);
    for (const auto &[user_id, member] : members) {
      if (member.user.id != user_id)
        ++mismatched;
    }
    if (members.size() > max_seen)
      max_seen = members.size();
    cache.get_message(1);
  }
  writer.join();

  CHECK(mismatched == 0);
  CHECK(max_seen <= 500);
  CHECK(cache.get_members_view(1).size() == 500 - 500 / 3);
  CHECK(cache.stats().unresolved_records == 0);
}
