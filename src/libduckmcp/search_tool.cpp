#include "duckmcp/search_tool.hpp"

#include <cstdint>

#include "duckmcp/logger.hpp"
#include "duckmcp/results.hpp"

namespace duckmcp {

namespace {

json::object make_tool_result(
    std::string_view query, const std::vector<search_result>& results) {
  json::object text;
  text["type"] = "text";
  text["text"] = render_text(query, results);
  json::array content;
  content.push_back(std::move(text));

  json::object structured;
  structured["query"] = query;
  structured["count"] = static_cast<std::int64_t>(results.size());
  structured["results"] = results_to_json(results);
  structured["cached"] = false;

  json::object doc;
  doc["content"] = std::move(content);
  doc["structuredContent"] = std::move(structured);
  return doc;
}

}  // namespace

json::object search_tool::call(const search_params& params) {
  if (auto hit = cache_->lookup(params.query, params.max_results)) {
    LOG_INFO("search: cache hit for '{}' ({})", params.query,
             params.max_results);
    auto doc = hit->as_object();
    if (auto* structured = doc.if_contains("structuredContent"))
      structured->as_object()["cached"] = true;
    return doc;
  }

  LOG_INFO(
      "search: '{}' (effective_max={}, all_results={}, region={}, "
      "safesearch={}, timelimit={})",
      params.query, params.max_results, params.all_results, params.region,
      to_string(params.safesearch),
      params.timelimit ? to_string(*params.timelimit) : "none");

  auto raw = adapter_->search(params.to_query());
  auto results = transform(raw);
  LOG_INFO("search: {} raw records, {} kept", raw.size(), results.size());

  auto doc = make_tool_result(params.query, results);
  if (!results.empty())
    cache_->store(params.query, params.max_results, doc);
  return doc;
}

}  // namespace duckmcp
