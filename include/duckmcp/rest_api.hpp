#pragma once

#include <boost/json.hpp>
#include <string_view>

#include "duckmcp/search.hpp"
#include "duckmcp/search_tool.hpp"

namespace duckmcp {

namespace json = boost::json;

// Status code and JSON body of a plain (non-streaming) HTTP reply.
struct api_reply {
  int status;
  json::object body;
};

/** @brief `POST /search`: a JSON search without the MCP envelope.
 *
 * Body is `{"query": string, "max_results": 1..10}`.  Replies 200 with
 * `{results, query, count, cached, request_id}`; 400 for a body that is
 * not JSON; 422 for a failed validation; 503 when the search fails; 500
 * for anything else.  Never throws.
 */
api_reply search_endpoint(
    std::string_view body, search_tool& tool, std::string_view request_id);

// `GET /ready`: one single-result search straight against the provider.
// 200 `{status: "ready", checks: {duckduckgo: "ok"}}`, else 503.
api_reply readiness(search_provider& provider);

}  // namespace duckmcp
