#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "duckmcp/search.hpp"

namespace duckmcp {

namespace json = boost::json;

struct search_result {
  std::string title;
  std::string url;
  std::string snippet;
};

constexpr std::size_t max_snippet_chars{200};

// Trim fields, drop records without title or body, keep the first record
// per URL.  Records without a URL are never considered duplicates.
std::vector<search_result> transform(std::span<const raw_record> raw);

// Collapse whitespace runs to one space; cap at `limit` code points,
// ending in "..." when cut.
std::string clean_snippet(std::string_view body, std::size_t limit);

// Authority part of `url`, or "link" when there is none.
std::string domain_hint(std::string_view url);

// Markdown block shown to the model.
std::string render_text(
    std::string_view query, std::span<const search_result> results);

json::array results_to_json(std::span<const search_result> results);

}  // namespace duckmcp
