#include <chrono>
#include <exception>
#include <span>

#include "duckmcp/cache.hpp"
#include "duckmcp/config.hpp"
#include "duckmcp/dispatcher.hpp"
#include "duckmcp/duckduckgo.hpp"
#include "duckmcp/logger.hpp"
#include "duckmcp/search.hpp"
#include "duckmcp/search_tool.hpp"
#include "web_server.hpp"

namespace mcp = duckmcp;

int main(int argc, char* argv[]) {
  mcp::settings cfg;
  if (auto code = mcp::parse_options(
          std::span<char*>{argv, static_cast<std::size_t>(argc)}, cfg))
    return *code;

  mcp::logger::set_level(cfg.log_level);

  try {
    mcp::validate(cfg);
  } catch (const mcp::config_error& e) {
    LOG_FATAL("invalid configuration: {}", e.what());
    return 2;
  }

  LOG_INFO(
      "Starting {} v{} (cache {}, ttl {}s, max {})", cfg.app_name,
      cfg.app_version, cfg.cache_enabled ? "on" : "off", cfg.cache_ttl,
      cfg.cache_max_size);

  mcp::search_cache cache{mcp::cache_options{
    cfg.cache_enabled, std::chrono::seconds{cfg.cache_ttl},
    cfg.cache_max_size}};
  mcp::duckduckgo_provider provider{std::chrono::seconds{cfg.search_timeout}};
  mcp::search_adapter adapter{provider};
  mcp::search_tool tool{cache, adapter};
  mcp::dispatcher dispatcher{tool, {cfg.app_name, cfg.app_version}};

  mcp::service svc{cfg, cache, provider, tool, dispatcher};
  try {
    mcp::run_web_server(svc);
  } catch (const std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
  return 0;
}
