#include <unistd.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <format>
#include <string>
#include <string_view>

#include "../libduckmcp/json_helpers.hpp"
#include "duckmcp/logger.hpp"
#include "duckmcp/protocol.hpp"
#include "duckmcp/rest_api.hpp"
#include "web_server.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace duckmcp {

namespace {

using steady = std::chrono::steady_clock;
using request_t = http::request<http::string_body>;
using response_t = http::response<http::string_body>;

std::string new_request_id() {
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

// Per-request bookkeeping shared by every response path.
struct exchange {
  std::string id{new_request_id()};
  steady::time_point start{steady::now()};

  [[nodiscard]] double elapsed() const {
    return std::chrono::duration<double>(steady::now() - start).count();
  }
};

template <typename Body>
void set_common_headers(
    http::response<Body>& res, const exchange& ex, const settings& cfg) {
  res.set("X-Request-ID", ex.id);
  res.set("X-Process-Time", std::format("{:.4f}", ex.elapsed()));
  if (cfg.cors_enabled) res.set(http::field::access_control_allow_origin, "*");
}

response_t make_json_response(
    http::status status_code, const json::value& body, const request_t& req) {
  response_t res{status_code, req.version()};
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = json::serialize(body);
  return res;
}

response_t make_error(
    http::status status_code, std::string_view detail, const request_t& req) {
  return make_json_response(status_code, error_to_json(detail), req);
}

std::string utc_timestamp() {
  auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return std::format("{:%FT%T}Z", now);
}

// ── Routes ────────────────────────────────────────────────────────────────

response_t handle_health(const request_t& req, service& svc) {
  json::object obj;
  obj["status"] = "healthy";
  obj["timestamp"] = utc_timestamp();
  obj["service"] = svc.config.app_name;
  return make_json_response(http::status::ok, obj, req);
}

response_t handle_metrics(const request_t& req, service& svc) {
  auto& m = svc.metrics;
  auto requests = m.requests.load();
  auto uptime =
      std::chrono::duration<double>(steady::now() - m.started).count();

  json::object obj;
  obj["uptime_seconds"] = uptime;
  obj["total_requests"] = requests;
  obj["total_errors"] = m.errors.load();
  obj["average_request_duration"] =
      requests == 0 ? 0.0
                    : static_cast<double>(m.total_micros.load()) / 1e6 /
                          static_cast<double>(requests);
  obj["cache"] = cache_stats_to_json(svc.cache.stats());
  obj["config"] = settings_to_json(svc.config);
  return make_json_response(http::status::ok, obj, req);
}

response_t handle_cache_clear(const request_t& req, service& svc) {
  svc.cache.clear();
  LOG_INFO("cache cleared on request");
  json::object obj;
  obj["status"] = "success";
  obj["message"] = "Cache cleared successfully";
  return make_json_response(http::status::ok, obj, req);
}

response_t reply_with(const api_reply& r, const request_t& req) {
  return make_json_response(static_cast<http::status>(r.status), r.body, req);
}

template <typename Body, typename Allocator>
response_t dispatch(
    const http::request<Body, http::basic_fields<Allocator>>& req,
    service& svc, const exchange& ex) {
  const std::string target{req.target()};
  const auto method = req.method();

  if (method == http::verb::options && svc.config.cors_enabled) {
    response_t res{http::status::no_content, req.version()};
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "*");
    res.keep_alive(req.keep_alive());
    return res;
  }
  if (method == http::verb::get && target == "/health")
    return handle_health(req, svc);
  if (method == http::verb::get && target == "/metrics")
    return handle_metrics(req, svc);
  if (method == http::verb::post && target == "/cache/clear")
    return handle_cache_clear(req, svc);
  if (method == http::verb::get && target == "/ready")
    return reply_with(readiness(svc.provider), req);
  if (method == http::verb::post && target == "/search")
    return reply_with(search_endpoint(req.body(), svc.tool, ex.id), req);

  return make_error(http::status::not_found, "Not Found", req);
}

// POST / answers with an event stream; one chunk per frame.
bool stream_events(
    beast::tcp_stream& stream, const request_t& req, service& svc,
    const exchange& ex) {
  http::response<http::empty_body> res{http::status::ok, req.version()};
  res.set(http::field::content_type, "text/event-stream");
  res.set(http::field::cache_control, "no-cache");
  res.set("X-Accel-Buffering", "no");
  set_common_headers(res, ex, svc.config);
  res.keep_alive(req.keep_alive());
  res.chunked(true);

  beast::error_code ec;
  http::response_serializer<http::empty_body> sr{res};
  http::write_header(stream, sr, ec);
  if (ec) {
    LOG_WARN("SSE header write failed: {}", ec.message());
    return false;
  }

  svc.mcp.dispatch(req.body(), [&](const frame& f) {
    auto text = format_frame(f);
    net::write(stream, http::make_chunk(net::buffer(text)), ec);
    if (ec) LOG_WARN("SSE write failed: {}", ec.message());
    return !ec;
  });
  if (ec) return false;

  net::write(stream, http::make_chunk_last(), ec);
  return !ec;
}

void record(service& svc, const exchange& ex, unsigned status) {
  ++svc.metrics.requests;
  if (status >= 400) ++svc.metrics.errors;
  svc.metrics.total_micros += static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          steady::now() - ex.start)
          .count());
}

}  // namespace

// ── Connection handler ────────────────────────────────────────────────────

void handle_connection(int socket_fd, service& svc) {
  // Each worker thread owns its own io_context for purely synchronous use.
  net::io_context ioc;
  net::ip::tcp::socket raw_sock{ioc};
  boost::system::error_code ec;
  raw_sock.assign(net::ip::tcp::v4(), socket_fd, ec);
  if (ec) {
    ::close(socket_fd);
    return;
  }

  beast::tcp_stream stream{std::move(raw_sock)};
  beast::flat_buffer buffer;

  for (;;) {
    request_t req;
    http::read(stream, buffer, req, ec);
    if (ec) break;

    const bool streaming =
        req.method() == http::verb::post && req.target() == "/";
    try {
      exchange ex;
      LOG_INFO("{} {} [{}]", std::string{req.method_string()},
               std::string{req.target()}, ex.id);

      if (streaming) {
        bool ok = stream_events(stream, req, svc, ex);
        record(svc, ex, 200);
        LOG_INFO("→ 200 (event stream) in {:.4f}s", ex.elapsed());
        if (!ok || !req.keep_alive()) break;
        continue;
      }

      auto res = dispatch(req, svc, ex);
      set_common_headers(res, ex, svc.config);
      res.prepare_payload();
      auto status = static_cast<unsigned>(res.result_int());
      record(svc, ex, status);
      LOG_INFO("→ {} in {:.4f}s", status, ex.elapsed());
      http::write(stream, res, ec);
      if (ec || !req.keep_alive()) break;
    } catch (const std::exception& e) {
      LOG_ERROR("{} {} failed: {}", std::string{req.method_string()},
                std::string{req.target()}, e.what());
      ++svc.metrics.requests;
      ++svc.metrics.errors;
      // An event stream may already be under way; just drop the connection.
      if (streaming) break;
      auto res = make_error(
          http::status::internal_server_error, "Internal server error", req);
      res.keep_alive(false);
      res.prepare_payload();
      http::write(stream, res, ec);
      break;
    }
  }

  stream.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
}

}  // namespace duckmcp
