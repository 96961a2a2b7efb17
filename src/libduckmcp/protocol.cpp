#include "duckmcp/protocol.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "utils.hpp"

namespace duckmcp {

envelope parse_envelope(const json::value& body) {
  const auto* obj = body.if_object();
  if (!obj) throw std::invalid_argument{"request body must be a JSON object"};

  envelope env;
  if (const auto* m = obj->if_contains("method")) {
    if (const auto* s = m->if_string()) env.method = std::string{*s};
  }
  if (const auto* p = obj->if_contains("params")) {
    if (const auto* po = p->if_object())
      env.params = *po;
    else
      env.params_malformed = !p->is_null();
  }
  if (const auto* id = obj->if_contains("id")) {
    if (!id->is_null()) env.id = *id;
  }
  if (const auto* v = obj->if_contains("jsonrpc")) {
    const auto* s = v->if_string();
    env.jsonrpc = s && *s == "2.0";
  }
  return env;
}

request classify(const envelope& env) {
  if (!env.method) return missing_method{};
  const auto& method = *env.method;

  if (method == "initialize") return initialize_request{};
  if (method == "resources/list") return resources_list_request{};
  if (method == "tools/list") return tools_list_request{};
  if (method == "notifications/initialized") return initialized_notification{};
  if (method == "notifications/cancelled") {
    cancelled_notification n;
    if (const auto* id = env.params.if_contains("requestId")) n.request_id = *id;
    n.reason = "Unknown";
    if (const auto* r = env.params.if_contains("reason")) {
      if (const auto* s = r->if_string()) n.reason = std::string{*s};
    }
    return n;
  }
  if (method == "tools/call") {
    if (env.params_malformed) return malformed_params{"params must be an object"};
    tool_call_request call;
    if (const auto* n = env.params.if_contains("name")) {
      if (const auto* s = n->if_string())
        call.name = std::string{*s};
      else
        return malformed_params{"tool name must be a string"};
    }
    if (const auto* a = env.params.if_contains("arguments")) {
      if (const auto* ao = a->if_object())
        call.arguments = *ao;
      else if (!a->is_null())
        return malformed_params{"tool arguments must be an object"};
    }
    return call;
  }
  return unknown_method{method};
}

std::optional<long long> coerce_integer(const json::value& v) {
  switch (v.kind()) {
    case json::kind::int64: return v.get_int64();
    case json::kind::uint64: {
      auto u = v.get_uint64();
      if (u > static_cast<uint64_t>(std::numeric_limits<long long>::max()))
        return std::numeric_limits<long long>::max();
      return static_cast<long long>(u);
    }
    case json::kind::double_: {
      auto d = v.get_double();
      if (!std::isfinite(d)) return std::nullopt;
      if (d >= static_cast<double>(std::numeric_limits<long long>::max()))
        return std::numeric_limits<long long>::max();
      if (d <= static_cast<double>(std::numeric_limits<long long>::min()))
        return std::numeric_limits<long long>::min();
      return static_cast<long long>(std::trunc(d));
    }
    case json::kind::bool_: return v.get_bool() ? 1 : 0;
    case json::kind::string: {
      auto text = utils::trim(v.get_string());
      if (!text.empty() && text.front() == '+') text.erase(0, 1);
      long long n{};
      auto [ptr, ec] =
          std::from_chars(text.data(), text.data() + text.size(), n);
      if (ec != std::errc{} || ptr != text.data() + text.size() ||
          text.empty())
        return std::nullopt;
      return n;
    }
    default: return std::nullopt;
  }
}

bool truthy(const json::value& v) {
  switch (v.kind()) {
    case json::kind::null: return false;
    case json::kind::bool_: return v.get_bool();
    case json::kind::int64: return v.get_int64() != 0;
    case json::kind::uint64: return v.get_uint64() != 0;
    case json::kind::double_: return v.get_double() != 0.0;
    case json::kind::string: return !v.get_string().empty();
    case json::kind::array: return !v.get_array().empty();
    case json::kind::object: return !v.get_object().empty();
  }
  return false;
}

std::optional<search_params> parse_search_arguments(const json::object& args) {
  search_params p;

  // Any truthy value is searched; non-strings as their JSON text.
  const auto* q = args.if_contains("query");
  if (!q || !truthy(*q)) return std::nullopt;
  if (const auto* s = q->if_string())
    p.query = std::string{*s};
  else
    p.query = json::serialize(*q);

  if (const auto* all = args.if_contains("all_results"))
    p.all_results = truthy(*all);

  if (p.all_results) {
    p.max_results = max_results_cap;
  } else {
    long long requested{default_max_results};
    if (const auto* m = args.if_contains("max_results"))
      requested = coerce_integer(*m).value_or(default_max_results);
    p.max_results = static_cast<int>(
        std::clamp<long long>(requested, 1, max_results_cap));
  }

  if (const auto* r = args.if_contains("region")) {
    if (const auto* s = r->if_string()) {
      auto region = utils::trim(*s);
      if (!region.empty()) p.region = std::move(region);
    }
  }

  if (const auto* ss = args.if_contains("safesearch")) {
    if (const auto* s = ss->if_string())
      p.safesearch = parse_safesearch(*s).value_or(safesearch_level::moderate);
  }

  if (const auto* t = args.if_contains("timelimit")) {
    if (const auto* s = t->if_string()) p.timelimit = parse_time_limit(*s);
  }

  return p;
}

json::object initialize_result(
    std::string_view name, std::string_view version) {
  json::object capabilities;
  capabilities["tools"] = json::object{};
  capabilities["resources"] = json::object{};

  json::object server_info;
  server_info["name"] = name;
  server_info["version"] = version;

  json::object result;
  result["protocolVersion"] = protocol_version;
  result["capabilities"] = std::move(capabilities);
  result["serverInfo"] = std::move(server_info);
  return result;
}

json::object resources_list_result() {
  json::object resource;
  resource["uri"] = "mcp://duckduckgo/search";
  resource["name"] = "DuckDuckGo Search";
  resource["description"] = "Web search via DuckDuckGo";

  json::array resources;
  resources.push_back(std::move(resource));

  json::object result;
  result["resources"] = std::move(resources);
  return result;
}

json::object tools_list_result() {
  auto property = [](std::string_view type, std::string_view description) {
    json::object p;
    p["type"] = type;
    p["description"] = description;
    return p;
  };

  json::object properties;
  properties["query"] = property("string", "The search query");

  auto max_results = property(
      "integer",
      fmt::format("Maximum number of results (capped at {})", max_results_cap));
  max_results["default"] = default_max_results;
  max_results["minimum"] = 1;
  max_results["maximum"] = max_results_cap;
  properties["max_results"] = std::move(max_results);

  auto all_results = property(
      "boolean",
      fmt::format("Fetch maximum results (capped at {})", max_results_cap));
  all_results["default"] = false;
  properties["all_results"] = std::move(all_results);

  auto region = property(
      "string", "Search region, e.g., wt-wt (global), us-en, uk-en");
  region["default"] = default_region;
  properties["region"] = std::move(region);

  auto safesearch =
      property("string", "SafeSearch level: off | moderate | strict");
  safesearch["default"] = "moderate";
  safesearch["enum"] = json::array{"off", "moderate", "strict"};
  properties["safesearch"] = std::move(safesearch);

  auto timelimit = property(
      "string",
      "Time limit for results: d (day), w (week), m (month), y (year)");
  timelimit["enum"] = json::array{"d", "w", "m", "y"};
  properties["timelimit"] = std::move(timelimit);

  json::object schema;
  schema["type"] = "object";
  schema["properties"] = std::move(properties);
  schema["required"] = json::array{"query"};

  json::object tool;
  tool["name"] = search_tool_name;
  tool["description"] = "Search the web using DuckDuckGo";
  tool["inputSchema"] = std::move(schema);

  json::array tools;
  tools.push_back(std::move(tool));

  json::object result;
  result["tools"] = std::move(tools);
  return result;
}

json::object error_object(const rpc_error& err) {
  json::object error;
  error["code"] = err.code;
  error["message"] = err.message;
  return error;
}

json::object make_result_response(const json::value& id, json::value result) {
  json::object response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["result"] = std::move(result);
  return response;
}

json::object make_error_response(const json::value& id, const rpc_error& err) {
  json::object response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["error"] = error_object(err);
  return response;
}

}  // namespace duckmcp
