#pragma once

#include <boost/json.hpp>

#include "duckmcp/cache.hpp"
#include "duckmcp/protocol.hpp"
#include "duckmcp/search.hpp"

namespace duckmcp {

namespace json = boost::json;

/** @brief The `web_search` pipeline: cache, provider, transformer.
 *
 * Produces an MCP tool result document:
 * @code
 * {"content": [{"type": "text", "text": "..."}],
 *  "structuredContent": {"query": ..., "count": N, "results": [...],
 *                        "cached": bool}}
 * @endcode
 * Throws search_error when the provider fails fatally.
 */
class search_tool {
 public:
  search_tool(search_cache& cache, search_adapter& adapter)
      : cache_{&cache}, adapter_{&adapter} {}

  json::object call(const search_params& params);

 private:
  search_cache* cache_;
  search_adapter* adapter_;
};

}  // namespace duckmcp
