#include "duckmcp/search.hpp"

#include <re2/re2.h>

#include <exception>

#include "duckmcp/logger.hpp"
#include "utils.hpp"

namespace duckmcp {

std::string_view to_string(safesearch_level level) {
  switch (level) {
    case safesearch_level::off: return "off";
    case safesearch_level::moderate: return "moderate";
    case safesearch_level::strict: return "strict";
  }
  return "moderate";
}

std::string_view to_string(time_limit limit) {
  switch (limit) {
    case time_limit::day: return "d";
    case time_limit::week: return "w";
    case time_limit::month: return "m";
    case time_limit::year: return "y";
  }
  return "";
}

std::string_view to_string(search_errc kind) {
  switch (kind) {
    case search_errc::unsupported_parameters: return "unsupported_parameters";
    case search_errc::formatting_defect: return "formatting_defect";
    case search_errc::network: return "network";
    case search_errc::fatal: return "fatal";
  }
  return "fatal";
}

std::optional<safesearch_level> parse_safesearch(std::string_view s) {
  auto lower = utils::to_lower(s);
  if (lower == "off") return safesearch_level::off;
  if (lower == "moderate") return safesearch_level::moderate;
  if (lower == "strict") return safesearch_level::strict;
  return std::nullopt;
}

std::optional<time_limit> parse_time_limit(std::string_view s) {
  auto lower = utils::to_lower(s);
  if (lower == "d" || lower == "day") return time_limit::day;
  if (lower == "w" || lower == "week") return time_limit::week;
  if (lower == "m" || lower == "month") return time_limit::month;
  if (lower == "y" || lower == "year") return time_limit::year;
  return std::nullopt;
}

search_errc classify_failure(std::string_view message) {
  static const RE2 network_re{
    R"((?i)dns|connection|timeout|timed out|refused|unreachable|resolve)"};
  if (RE2::PartialMatch(message, network_re)) return search_errc::network;
  return search_errc::fatal;
}

std::vector<raw_record> search_adapter::attempt(const search_query& query) {
  try {
    return provider_->text(query);
  } catch (const search_error&) {
    throw;
  } catch (const std::exception& e) {
    throw search_error{classify_failure(e.what()), e.what()};
  }
}

std::vector<raw_record> search_adapter::search(const search_query& query) {
  auto absorb = [&](const search_error& e) -> std::vector<raw_record> {
    switch (e.kind) {
      case search_errc::formatting_defect:
        LOG_WARN("search: provider formatting defect, no results: {}",
                 e.what());
        return {};
      case search_errc::network:
        LOG_WARN("search: network failure, no results: {}", e.what());
        return {};
      default:
        LOG_ERROR("search: '{}' failed ({}): {}", query.text,
                  to_string(e.kind), e.what());
        throw search_error{search_errc::fatal, e.what()};
    }
  };

  try {
    return attempt(query);
  } catch (const search_error& e) {
    if (e.kind != search_errc::unsupported_parameters) return absorb(e);
    LOG_WARN("search: parameters rejected ({}), retrying minimal query",
             e.what());
  }

  try {
    return attempt(query.minimal());
  } catch (const search_error& e) {
    return absorb(e);
  }
}

}  // namespace duckmcp
