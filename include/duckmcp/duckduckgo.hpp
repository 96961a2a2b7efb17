#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "duckmcp/search.hpp"

namespace duckmcp {

/** @brief Scrapes DuckDuckGo's HTML endpoint over HTTPS.
 *
 * Every call opens its own connection; the instance holds only
 * configuration, so one provider serves all worker threads.
 */
class duckduckgo_provider : public search_provider {
 public:
  explicit duckduckgo_provider(
      std::chrono::seconds timeout = std::chrono::seconds{30});

  std::vector<raw_record> text(const search_query& query) override;

  // Form body POSTed to /html/.
  static std::string make_form(const search_query& query);

 private:
  std::string fetch(const std::string& form) const;

  std::chrono::seconds timeout_;
};

// Extract up to `limit` records from a result page.  Throws search_error
// (formatting_defect) when the page has neither results nor a
// "no results" marker.
std::vector<raw_record> parse_result_page(std::string_view html, int limit);

// Undo DuckDuckGo's "/l/?uddg=<target>" redirect wrapping.
std::string unwrap_redirect(std::string_view href);

// OpenSSL errors, such as a failed certificate check, are fatal.  Any
// other transport error is a network failure.
search_errc classify_transport_error(const boost::system::error_code& ec);

// Strip tags and decode entities.
std::string html_to_text(std::string_view html);

}  // namespace duckmcp
