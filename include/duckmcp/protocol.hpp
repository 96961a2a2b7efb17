#pragma once

/**
 * @file protocol.hpp
 * @brief Typed view of the JSON-RPC-like envelopes the server accepts.
 *
 * On the wire everything is a generic JSON document.  Internally each
 * method gets its own request struct, and the whole set is a variant the
 * dispatcher visits.
 */

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <variant>

#include "duckmcp/search.hpp"

namespace duckmcp {

namespace json = boost::json;

// JSONRPC error codes
constexpr int PARSE_ERROR{-32700};
constexpr int INVALID_REQUEST{-32600};
constexpr int METHOD_NOT_FOUND{-32601};
constexpr int INVALID_PARAMS{-32602};
constexpr int INTERNAL_ERROR{-32603};

constexpr std::string_view protocol_version{"2025-06-18"};
constexpr std::string_view search_tool_name{"web_search"};

constexpr int default_max_results{5};
constexpr int max_results_cap{10};
constexpr std::string_view default_region{"wt-wt"};

struct envelope {
  std::optional<std::string> method;
  json::object params;
  bool params_malformed{};        // present but neither object nor null
  std::optional<json::value> id;  // JSON null is treated as absent
  bool jsonrpc{};                 // "jsonrpc": "2.0"

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
  [[nodiscard]] bool wraps() const { return jsonrpc && id.has_value(); }
};

// Throws std::invalid_argument when `body` is not a JSON object.
envelope parse_envelope(const json::value& body);

/// Requests, one per routed method

struct initialize_request {};
struct resources_list_request {};
struct tools_list_request {};
struct initialized_notification {};
struct cancelled_notification {
  json::value request_id;
  std::string reason;
};
struct tool_call_request {
  std::string name;
  json::object arguments;
};
struct malformed_params {
  std::string message;
};
struct missing_method {};
struct unknown_method {
  std::string name;
};

using request = std::variant<
    initialize_request, resources_list_request, tools_list_request,
    initialized_notification, cancelled_notification, tool_call_request,
    malformed_params, missing_method, unknown_method>;

request classify(const envelope& env);

/// Search tool parameters

struct search_params {
  std::string query;
  int max_results{default_max_results};  // effective, in [1, cap]
  bool all_results{};
  std::string region{default_region};
  safesearch_level safesearch{safesearch_level::moderate};
  std::optional<time_limit> timelimit{};

  [[nodiscard]] search_query to_query() const {
    return {query, max_results, region, safesearch, timelimit};
  }
};

// Nothing when `query` is missing or empty; every other field falls back
// to its default when absent or invalid.
std::optional<search_params> parse_search_arguments(const json::object& args);

// Lenient integer coercion: integers, truncated floats, numeric strings,
// booleans.  Nothing for everything else.
std::optional<long long> coerce_integer(const json::value& v);

// JSON truthiness: false for null, false, 0, "", [] and {}.
bool truthy(const json::value& v);

/// Static method results

json::object initialize_result(std::string_view name, std::string_view version);
json::object resources_list_result();
json::object tools_list_result();

/// Envelopes for replies

struct rpc_error {
  int code;
  std::string message;
};

json::object error_object(const rpc_error& err);

json::object make_result_response(const json::value& id, json::value result);
json::object make_error_response(const json::value& id, const rpc_error& err);

}  // namespace duckmcp
