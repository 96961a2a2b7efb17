#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace duckmcp {

namespace json = boost::json;

struct cache_options {
  bool enabled{true};
  std::chrono::seconds ttl{3600};
  std::size_t max_size{1000};
};

struct cache_stats {
  bool enabled;
  std::size_t size;
  std::size_t max_size;
  std::chrono::seconds ttl;
};

/** @brief Bounded, TTL-expiring store of search payloads.
 *
 * Keyed by the fingerprint of (query, result count).  When full, the entry
 * stored longest ago is evicted; lookups never refresh an entry, so this
 * is insertion-order eviction, not LRU.  A disabled cache misses on every
 * lookup and ignores stores.  All operations are serialized by one mutex.
 */
class search_cache {
 public:
  using clock_t = std::chrono::steady_clock;
  using clock_fn = std::function<clock_t::time_point()>;

  explicit search_cache(
      cache_options options, clock_fn now = [] { return clock_t::now(); });

  std::optional<json::value> lookup(std::string_view query, int count);
  void store(std::string_view query, int count, json::value data);
  void clear();
  [[nodiscard]] cache_stats stats() const;

  // MD5 hex digest of "<query>:<count>".
  static std::string fingerprint(std::string_view query, int count);

 private:
  struct entry {
    json::value data;
    clock_t::time_point timestamp;
    uint64_t sequence;
  };

  void evict_oldest();  // caller holds mutex_

  cache_options options_;
  clock_fn now_;
  uint64_t next_sequence_{0};
  std::unordered_map<std::string, entry> entries_;
  mutable std::mutex mutex_;
};

}  // namespace duckmcp
