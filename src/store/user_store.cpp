#include "gateway_cache/user_store.hpp"

#include "gateway_cache/logging.hpp"

namespace gateway_cache {

std::optional<User> UserStore::get(Snowflake id) const {
  auto it = users_.find(id);
  if (it == users_.end())
    return std::nullopt;
  return it->second;
}

const User *UserStore::find(Snowflake id) const {
  auto it = users_.find(id);
  if (it == users_.end())
    return nullptr;
  return &it->second;
}

void UserStore::set(const User &user) { users_[user.id] = user; }

std::optional<User> UserStore::erase(Snowflake id) {
  auto it = users_.find(id);
  if (it == users_.end())
    return std::nullopt;
  User user = std::move(it->second);
  users_.erase(it);
  return user;
}

std::pair<std::optional<User>, std::optional<User>>
UserStore::update(const User &user) {
  auto old = get(user.id);
  set(user);
  return {std::move(old), get(user.id)};
}

std::unordered_map<Snowflake, User> UserStore::clear() {
  std::unordered_map<Snowflake, User> out;
  out.swap(users_);
  return out;
}

void UserStore::acquire(const User &user) {
  set(user);
  acquire(user.id);
}

void UserStore::acquire(Snowflake id) {
  ++references_[id];
  ++stats_.acquires;
}

bool UserStore::release(Snowflake id) {
  auto it = references_.find(id);
  if (it == references_.end() || it->second == 0) {
    ++stats_.underflows;
    GATEWAY_CACHE_LOG_WARN("user reference released more often than taken",
                           {id_field("user_id", id)});
    return false;
  }
  ++stats_.releases;
  if (--it->second > 0)
    return false;

  references_.erase(it);
  if (users_.erase(id) > 0) {
    ++stats_.collected;
    GATEWAY_CACHE_LOG_DEBUG("user collected", {id_field("user_id", id)});
  }
  return true;
}

std::size_t UserStore::reference_count(Snowflake id) const {
  auto it = references_.find(id);
  if (it == references_.end())
    return 0;
  return it->second;
}

} // namespace gateway_cache
