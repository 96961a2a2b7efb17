#include "duckmcp/results.hpp"

#include <fmt/format.h>

#include <unordered_set>

#include "utils.hpp"

namespace duckmcp {

std::vector<search_result> transform(std::span<const raw_record> raw) {
  std::vector<search_result> out;
  std::unordered_set<std::string> seen;
  for (const auto& rec : raw) {
    auto title = utils::trim(rec.title);
    auto href = utils::trim(rec.href);
    auto body = utils::trim(rec.body);
    if (title.empty() || body.empty()) continue;
    if (!href.empty() && !seen.insert(href).second) continue;
    out.push_back({std::move(title), std::move(href), std::move(body)});
  }
  return out;
}

std::string clean_snippet(std::string_view body, std::size_t limit) {
  std::string collapsed;
  collapsed.reserve(body.size());
  bool pending_space{false};
  for (char c : body) {
    if (utils::is_space(c)) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) collapsed += ' ';
    pending_space = false;
    collapsed += c;
  }

  // Count UTF-8 code points, remembering where the 197th one ends.
  constexpr std::size_t ellipsis{3};
  std::size_t chars{0};
  std::size_t cut{collapsed.size()};
  for (std::size_t i = 0; i < collapsed.size(); ++i) {
    if ((static_cast<unsigned char>(collapsed[i]) & 0xC0) == 0x80) continue;
    if (chars == limit - ellipsis) cut = i;
    ++chars;
  }
  if (chars <= limit) return collapsed;
  collapsed.resize(cut);
  collapsed += "...";
  return collapsed;
}

std::string domain_hint(std::string_view url) {
  std::string_view rest;
  if (auto scheme = url.find("://"); scheme != std::string_view::npos)
    rest = url.substr(scheme + 3);
  else if (url.starts_with("//"))
    rest = url.substr(2);
  else
    return "link";

  auto end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, end);
  return authority.empty() ? "link" : std::string{authority};
}

std::string render_text(
    std::string_view query, std::span<const search_result> results) {
  if (results.empty()) return fmt::format("No results found for: {}", query);

  auto text = fmt::format(
      "## Search Results for: _{}_\n**Found {} result{}**\n\n", query,
      results.size(), results.size() == 1 ? "" : "s");
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto& r = results[i];
    auto body = clean_snippet(r.snippet, max_snippet_chars);
    if (i > 0) text += "\n\n";
    if (!r.url.empty()) {
      text += fmt::format(
          "**{}. [{}]({})**\n   📍 {}\n   {}", i + 1, r.title, r.url,
          domain_hint(r.url), body);
    } else {
      text += fmt::format("**{}. {}**\n   {}", i + 1, r.title, body);
    }
  }
  return text;
}

json::array results_to_json(std::span<const search_result> results) {
  json::array arr;
  for (const auto& r : results) {
    json::object obj;
    obj["title"] = r.title;
    obj["url"] = r.url;
    obj["snippet"] = clean_snippet(r.snippet, std::string_view::npos);
    arr.push_back(std::move(obj));
  }
  return arr;
}

}  // namespace duckmcp
