#include "duckmcp/rest_api.hpp"

#include <format>
#include <string>

#include "duckmcp/logger.hpp"
#include "duckmcp/protocol.hpp"
#include "json_helpers.hpp"
#include "utils.hpp"

namespace duckmcp {

namespace {

constexpr std::size_t kMaxQueryChars{500};

api_reply error_reply(int status, std::string_view detail) {
  return {status, error_to_json(detail)};
}

}  // namespace

api_reply search_endpoint(
    std::string_view body, search_tool& tool, std::string_view request_id) {
  try {
    boost::system::error_code ec;
    auto doc = json::parse(body, ec);
    if (ec) return error_reply(400, "invalid JSON body");
    auto* obj = doc.if_object();
    if (!obj) return error_reply(422, "body must be an object");

    const auto* q = obj->if_contains("query");
    if (!q || !q->is_string()) return error_reply(422, "query must be a string");
    const auto& raw_query = q->get_string();
    auto query = utils::trim({raw_query.data(), raw_query.size()});
    if (query.empty() || query.size() > kMaxQueryChars)
      return error_reply(
          422, std::format("query must be 1 to {} characters", kMaxQueryChars));

    search_params params;
    params.query = query;
    if (const auto* v = obj->if_contains("max_results"); v && !v->is_null()) {
      const auto* n = v->if_int64();
      if (!n || *n < 1 || *n > max_results_cap)
        return error_reply(
            422, std::format(
                     "max_results must be an integer in [1, {}]",
                     max_results_cap));
      params.max_results = static_cast<int>(*n);
    }

    json::object result;
    try {
      result = tool.call(params);
    } catch (const search_error& e) {
      LOG_ERROR("search API: {}", e.what());
      return error_reply(503, "Search service temporarily unavailable");
    }

    const auto& structured = result.at("structuredContent").as_object();
    json::object out;
    out["results"] = structured.at("results");
    out["query"] = params.query;
    out["count"] = structured.at("count");
    out["cached"] = structured.at("cached");
    out["request_id"] = request_id;
    return {200, std::move(out)};
  } catch (const std::exception& e) {
    LOG_ERROR("search API failed unexpectedly: {}", e.what());
    return error_reply(500, "Internal server error");
  }
}

api_reply readiness(search_provider& provider) {
  try {
    (void)provider.text(search_query{"test", 1});
  } catch (const std::exception& e) {
    LOG_ERROR("readiness check failed: {}", e.what());
    return error_reply(503, "Service not ready");
  }
  json::object checks;
  checks["duckduckgo"] = "ok";
  json::object out;
  out["status"] = "ready";
  out["checks"] = std::move(checks);
  return {200, std::move(out)};
}

}  // namespace duckmcp
