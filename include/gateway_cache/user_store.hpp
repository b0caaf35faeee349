#pragma once

#include "gateway_cache/entities.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>

namespace gateway_cache {

struct UserStoreStats {
  std::uint64_t acquires{0};
  std::uint64_t releases{0};
  std::uint64_t collected{0};
  std::uint64_t underflows{0};
};

// Shared users, reference counted by every record that names them (members,
// emoji creators, DM recipients, message authors). The counters live beside
// the users rather than inside them: a user object is only ever replaced
// whole so that before/after pairs can be compared.
class UserStore {
public:
  std::optional<User> get(Snowflake id) const;
  const User *find(Snowflake id) const;
  bool contains(Snowflake id) const { return users_.contains(id); }

  // Insert or replace; reference counts are left alone.
  void set(const User &user);
  std::optional<User> erase(Snowflake id);
  std::pair<std::optional<User>, std::optional<User>> update(const User &user);
  std::unordered_map<Snowflake, User> view() const { return users_; }
  std::unordered_map<Snowflake, User> clear();

  // Set the user and take a reference on it.
  void acquire(const User &user);
  void acquire(Snowflake id);
  // Drop one reference. Returns true when this was the last one; the user
  // is removed at that point.
  bool release(Snowflake id);
  std::size_t reference_count(Snowflake id) const;

  std::size_t size() const { return users_.size(); }
  std::size_t referenced_size() const { return references_.size(); }
  const UserStoreStats &stats() const { return stats_; }

private:
  std::unordered_map<Snowflake, User> users_;
  std::unordered_map<Snowflake, std::size_t> references_;
  UserStoreStats stats_;
};

} // namespace gateway_cache
