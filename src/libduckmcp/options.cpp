#include <CLI/CLI.hpp>
#include <optional>
#include <string>
#include <vector>

#include "duckmcp/config.hpp"
#include "utils.hpp"

namespace duckmcp {

void validate(const settings& s) {
  if (s.port < 1 || s.port > 65535)
    utils::throwf<config_error>("port {} out of range", s.port);
  if (s.workers < 1)
    utils::throwf<config_error>("need at least one worker, got {}", s.workers);
  if (s.search_timeout < 1)
    utils::throwf<config_error>(
        "search timeout must be positive, got {}", s.search_timeout);
  if (s.cache_enabled) {
    if (s.cache_ttl <= 0)
      utils::throwf<config_error>(
          "cache enabled with non-positive ttl {}", s.cache_ttl);
    if (s.cache_max_size == 0)
      utils::throwf<config_error>("cache enabled with zero capacity");
  }
}

std::optional<int> parse_options(std::span<char*> args, settings& s) {
  CLI::App app{"DuckDuckGo web search over MCP (HTTP + SSE)"};

  std::string level_name{logger::level_to_string(s.log_level)};

  app.add_option("--host", s.host, "Address to listen on")
      ->envname("MCP_HOST")
      ->capture_default_str();
  app.add_option("-p,--port", s.port, "Port to listen on")
      ->envname("MCP_PORT")
      ->check(CLI::Range(1, 65535))
      ->capture_default_str();
  app.add_option("--workers", s.workers, "Maximum concurrent connections")
      ->envname("MCP_WORKERS")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  app.add_option(
         "--search-timeout", s.search_timeout,
         "Upstream search timeout in seconds")
      ->envname("MCP_SEARCH_TIMEOUT")
      ->check(CLI::PositiveNumber)
      ->capture_default_str();
  app.add_option("--cache-enabled", s.cache_enabled, "Cache search results")
      ->envname("MCP_CACHE_ENABLED")
      ->capture_default_str();
  app.add_option("--cache-ttl", s.cache_ttl, "Cache entry lifetime in seconds")
      ->envname("MCP_CACHE_TTL")
      ->capture_default_str();
  app.add_option(
         "--cache-max-size", s.cache_max_size, "Maximum cached searches")
      ->envname("MCP_CACHE_MAX_SIZE")
      ->capture_default_str();
  app.add_option("--log-level", level_name, "trace|debug|info|warning|error")
      ->envname("MCP_LOG_LEVEL")
      ->check(
          [](const std::string& name) -> std::string {
            if (logger::level_from_string(name)) return {};
            return "unknown log level " + name;
          })
      ->capture_default_str();
  app.add_option("--cors", s.cors_enabled, "Send permissive CORS headers")
      ->envname("MCP_CORS_ENABLED")
      ->capture_default_str();
  app.add_option("--environment", s.environment, "Deployment environment")
      ->envname("MCP_ENVIRONMENT")
      ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  s.log_level = *logger::level_from_string(level_name);

  return std::nullopt;
}

}  // namespace duckmcp
