#pragma once

#include <boost/json.hpp>
#include <string_view>

#include "duckmcp/cache.hpp"
#include "duckmcp/config.hpp"

namespace duckmcp {

namespace json = boost::json;

inline json::object cache_stats_to_json(const cache_stats& stats) {
  json::object res;
  res["enabled"] = stats.enabled;
  res["size"] = stats.size;
  res["max_size"] = stats.max_size;
  res["ttl"] = stats.ttl.count();
  return res;
}

inline json::object settings_to_json(const settings& s) {
  json::object res;
  res["host"] = s.host;
  res["port"] = s.port;
  res["workers"] = s.workers;
  res["search_timeout"] = s.search_timeout;
  res["cache_enabled"] = s.cache_enabled;
  res["cache_ttl"] = s.cache_ttl;
  res["cache_max_size"] = s.cache_max_size;
  res["log_level"] = logger::level_to_string(s.log_level);
  res["cors_enabled"] = s.cors_enabled;
  return res;
}

inline json::object error_to_json(std::string_view detail) {
  json::object res;
  res["detail"] = detail;
  return res;
}

}  // namespace duckmcp
