#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "duckmcp/results.hpp"

using duckmcp::raw_record;
using duckmcp::search_result;

TEST_CASE("transform-drops-and-dedupes") {
  std::vector<raw_record> raw{
    {"  First  ", " https://a.example/1 ", "  body one "},
    {"", "https://a.example/2", "no title"},
    {"No body", "https://a.example/3", "   "},
    {"Duplicate", "https://a.example/1", "same url again"},
    {"No url 1", "", "kept"},
    {"No url 2", "", "also kept"},
  };

  auto out = duckmcp::transform(raw);
  REQUIRE(out.size() == 3);
  CHECK(out[0].title == "First");
  CHECK(out[0].url == "https://a.example/1");
  CHECK(out[0].snippet == "body one");
  CHECK(out[1].title == "No url 1");
  CHECK(out[2].title == "No url 2");
}

TEST_CASE("clean-snippet") {
  CHECK(duckmcp::clean_snippet("  a \n\t b   c ", 200) == "a b c");

  std::string exact(200, 'x');
  CHECK(duckmcp::clean_snippet(exact, 200) == exact);

  std::string longer(250, 'y');
  auto cut = duckmcp::clean_snippet(longer, 200);
  CHECK(cut.size() == 200);
  CHECK(cut == std::string(197, 'y') + "...");

  // Multi-byte characters count once.
  std::string accents;
  for (int i = 0; i < 201; ++i) accents += "é";
  auto cut_utf8 = duckmcp::clean_snippet(accents, 200);
  std::string expected;
  for (int i = 0; i < 197; ++i) expected += "é";
  CHECK(cut_utf8 == expected + "...");
}

TEST_CASE("domain-hint") {
  CHECK(duckmcp::domain_hint("https://www.example.com/a/b?c") == "www.example.com");
  CHECK(duckmcp::domain_hint("http://host:8080") == "host:8080");
  CHECK(duckmcp::domain_hint("//cdn.example.org/x") == "cdn.example.org");
  CHECK(duckmcp::domain_hint("not a url") == "link");
  CHECK(duckmcp::domain_hint("") == "link");
}

TEST_CASE("render-text-empty") {
  CHECK(duckmcp::render_text("nothing here", {}) ==
        "No results found for: nothing here");
}

TEST_CASE("render-text") {
  std::vector<search_result> results{
    {"Example", "https://example.com/x", "Some   text"},
    {"Bare", "", "Other"},
  };
  auto text = duckmcp::render_text("cats", results);
  CHECK(text ==
        "## Search Results for: _cats_\n"
        "**Found 2 results**\n\n"
        "**1. [Example](https://example.com/x)**\n"
        "   📍 example.com\n"
        "   Some text\n\n"
        "**2. Bare**\n"
        "   Other");

  std::vector<search_result> one{{"Only", "https://o.example", "x"}};
  CHECK(duckmcp::render_text("q", one).find("**Found 1 result**") !=
        std::string::npos);
}

TEST_CASE("results-to-json-keeps-full-snippet") {
  std::vector<search_result> results{
    {"T", "https://t.example", std::string(300, 'z')}};
  auto arr = duckmcp::results_to_json(results);
  REQUIRE(arr.size() == 1);
  const auto& obj = arr[0].as_object();
  CHECK(obj.at("title").as_string() == "T");
  CHECK(obj.at("url").as_string() == "https://t.example");
  CHECK(obj.at("snippet").as_string().size() == 300);
}
