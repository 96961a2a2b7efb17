#pragma once

#include <cstddef>
#include <span>
#include <optional>
#include <stdexcept>
#include <string>

#include "duckmcp/logger.hpp"

namespace duckmcp {

struct config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct settings {
  std::string app_name{"DuckDuckGo Web Search"};
  std::string app_version{"1.2.1"};
  std::string environment{"production"};

  std::string host{"0.0.0.0"};
  int port{8000};
  int workers{4};

  int search_timeout{30};  // seconds, per network step

  bool cache_enabled{true};
  int cache_ttl{3600};  // seconds
  std::size_t cache_max_size{1000};

  logger::level log_level{logger::level::info};
  bool cors_enabled{true};
};

// Throws config_error when the combination of values cannot be served.
void validate(const settings& s);

// Fills `s` from the command line, falling back to MCP_* environment
// variables.  Returns an exit code when the process should stop (help,
// parse errors), nothing otherwise.
std::optional<int> parse_options(std::span<char*> args, settings& s);

}  // namespace duckmcp
