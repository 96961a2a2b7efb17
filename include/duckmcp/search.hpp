#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace duckmcp {

enum class safesearch_level { off, moderate, strict };
enum class time_limit { day, week, month, year };

std::string_view to_string(safesearch_level level);
std::string_view to_string(time_limit limit);  // "d", "w", "m", "y"

std::optional<safesearch_level> parse_safesearch(std::string_view s);
std::optional<time_limit> parse_time_limit(std::string_view s);

// One record as the upstream returns it, before any cleaning.
struct raw_record {
  std::string title;
  std::string href;
  std::string body;
};

// What is asked of a provider.  Unset tuning fields mean "provider
// default"; a minimal query carries only the text and the count.
struct search_query {
  std::string text;
  int count{5};
  std::optional<std::string> region{};
  std::optional<safesearch_level> safesearch{};
  std::optional<time_limit> timelimit{};

  [[nodiscard]] search_query minimal() const { return {text, count}; }
};

enum class search_errc {
  unsupported_parameters,  // provider rejects the tuning combination
  formatting_defect,       // provider failed to produce output, benignly
  network,                 // DNS, refused, timeout, unreachable
  fatal,
};

std::string_view to_string(search_errc kind);

struct search_error : std::runtime_error {
  search_error(search_errc k, const std::string& what)
      : std::runtime_error{what}, kind{k} {}
  search_errc kind;
};

// Classify an unstructured failure message.
search_errc classify_failure(std::string_view message);

class search_provider {
 public:
  search_provider() = default;
  search_provider(const search_provider&) = delete;
  search_provider& operator=(const search_provider&) = delete;
  search_provider(search_provider&&) = delete;
  search_provider& operator=(search_provider&&) = delete;
  virtual ~search_provider() = default;

  // May throw search_error, or anything else on unexpected failures.
  virtual std::vector<raw_record> text(const search_query& query) = 0;
};

/** @brief Shields the protocol layer from provider failure modes.
 *
 * Parameter incompatibility is retried once with a minimal query; benign
 * formatting defects and network failures become an empty result list.
 * Only failures classified as search_errc::fatal escape, always as a
 * search_error.
 */
class search_adapter {
 public:
  explicit search_adapter(search_provider& provider) : provider_{&provider} {}

  std::vector<raw_record> search(const search_query& query);

 private:
  std::vector<raw_record> attempt(const search_query& query);

  search_provider* provider_;
};

}  // namespace duckmcp
