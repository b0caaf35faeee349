#include "gateway_cache/config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace gateway_cache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool valid_level(const std::string &level) {
  static const char *kLevels[] = {"trace", "debug", "info",     "warn",
                                  "warning", "err", "error", "critical",
                                  "off"};
  return std::find(std::begin(kLevels), std::end(kLevels), level) !=
         std::end(kLevels);
}
} // namespace

bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig cfg = out;
  constexpr std::uint64_t kMaxCapacity = 1ULL << 24;
  std::uint64_t u;
  std::string s;
  try {
    if (extract_u64(text, "dm_channel_capacity", u))
      cfg.dm_channel_capacity =
          static_cast<std::size_t>(std::min<std::uint64_t>(u, kMaxCapacity));
    if (extract_u64(text, "message_capacity", u))
      cfg.message_capacity =
          static_cast<std::size_t>(std::min<std::uint64_t>(u, kMaxCapacity));
  } catch (const std::out_of_range &) {
    if (err)
      *err = "capacity out of range";
    return false;
  }
  if (extract_string(text, "log_level", s)) {
    if (!valid_level(s)) {
      if (err)
        *err = "unknown log level: " + s;
      return false;
    }
    cfg.log_level = s;
  }
  if (extract_string(text, "log_pattern", s))
    cfg.log_pattern = s;

  out = cfg;
  return true;
}

bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), out, err);
}

} // namespace gateway_cache
