#include "duckmcp/cache.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>

#include "duckmcp/logger.hpp"
#include "utils.hpp"

namespace duckmcp {

search_cache::search_cache(cache_options options, clock_fn now)
    : options_{options}, now_{std::move(now)} {}

std::string search_cache::fingerprint(std::string_view query, int count) {
  auto content = fmt::format("{}:{}", query, count);

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{
    EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len{0};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
    utils::throwf("MD5 digest failed for cache key");
  }

  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i)
    hex += fmt::format("{:02x}", digest[i]);
  return hex;
}

std::optional<json::value> search_cache::lookup(
    std::string_view query, int count) {
  if (!options_.enabled) return std::nullopt;

  auto key = fingerprint(query, count);
  std::lock_guard<std::mutex> lock{mutex_};
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;

  if (now_() - it->second.timestamp > options_.ttl) {
    LOG_DEBUG("cache: expired entry for '{}' ({})", query, count);
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.data;
}

void search_cache::store(std::string_view query, int count, json::value data) {
  if (!options_.enabled) return;

  auto key = fingerprint(query, count);
  std::lock_guard<std::mutex> lock{mutex_};
  // Overwriting a live key does not grow the store, so nothing to evict.
  if (!entries_.contains(key) && entries_.size() >= options_.max_size)
    evict_oldest();
  entries_.insert_or_assign(
      std::move(key), entry{std::move(data), now_(), next_sequence_++});
}

void search_cache::evict_oldest() {
  if (entries_.empty()) return;
  auto oldest = std::ranges::min_element(
      entries_, [](const auto& a, const auto& b) {
        if (a.second.timestamp != b.second.timestamp)
          return a.second.timestamp < b.second.timestamp;
        return a.second.sequence < b.second.sequence;
      });
  entries_.erase(oldest);
}

void search_cache::clear() {
  std::lock_guard<std::mutex> lock{mutex_};
  entries_.clear();
}

cache_stats search_cache::stats() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return {
    .enabled = options_.enabled,
    .size = entries_.size(),
    .max_size = options_.max_size,
    .ttl = options_.ttl,
  };
}

}  // namespace duckmcp
