#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "duckmcp/cache.hpp"
#include "duckmcp/config.hpp"
#include "duckmcp/dispatcher.hpp"
#include "duckmcp/search.hpp"
#include "duckmcp/search_tool.hpp"

namespace duckmcp {

struct request_metrics {
  std::atomic<uint64_t> requests{0};
  std::atomic<uint64_t> errors{0};  // responses with status >= 400
  std::atomic<uint64_t> total_micros{0};
  std::chrono::steady_clock::time_point started{
    std::chrono::steady_clock::now()};
};

// Everything a connection handler needs.  Lives for the whole run.
struct service {
  const settings& config;
  search_cache& cache;
  search_provider& provider;  // for readiness checks
  search_tool& tool;
  const dispatcher& mcp;
  request_metrics metrics{};
};

// Serve HTTP requests on `socket_fd` until the peer closes or asks to.
// Owns and closes the descriptor.
void handle_connection(int socket_fd, service& svc);

// Blocks until SIGINT/SIGTERM, then drains the workers and clears the
// cache.
void run_web_server(service& svc);

}  // namespace duckmcp
