#include "duckmcp/duckduckgo.hpp"

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <re2/re2.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>
#include <array>
#include <charconv>
#include <future>

#include "duckmcp/logger.hpp"
#include "utils.hpp"

namespace duckmcp {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kHost{"html.duckduckgo.com"};
constexpr const char* kTarget{"/html/"};
constexpr const char* kUserAgent{
  "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
  "Chrome/124.0 Safari/537.36"};

using response_t = http::response<http::string_body>;

asio::awaitable<response_t> post_form(
    ssl::context& ctx, std::string form, std::chrono::seconds timeout) {
  auto executor{co_await asio::this_coro::executor};
  tcp::resolver resolver{executor};
  beast::ssl_stream<beast::tcp_stream> stream{executor, ctx};

  std::string host{kHost};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
    throw boost::system::system_error{
      static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
  }

  auto endpoints{
    co_await resolver.async_resolve(host, "443", asio::use_awaitable)};
  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await beast::get_lowest_layer(stream).async_connect(
      endpoints, asio::use_awaitable);

  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await stream.async_handshake(
      ssl::stream_base::client, asio::use_awaitable);

  http::request<http::string_body> req{http::verb::post, kTarget, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::content_type, "application/x-www-form-urlencoded");
  req.set(http::field::accept, "text/html");
  req.set(http::field::referer, "https://html.duckduckgo.com/");
  req.body() = std::move(form);
  req.prepare_payload();

  beast::get_lowest_layer(stream).expires_after(timeout);
  co_await http::async_write(stream, req, asio::use_awaitable);

  beast::flat_buffer buffer;
  response_t res;
  co_await http::async_read(stream, buffer, res, asio::use_awaitable);

  // Servers commonly drop the connection without close_notify.
  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds{2});
  co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
  if (ec && ec != ssl::error::stream_truncated && ec != asio::error::eof)
    LOG_DEBUG("ddg: TLS shutdown: {}", ec.message());

  co_return res;
}

void append_utf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x110000) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::string decode_entities(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '&') {
      out += s[i];
      continue;
    }
    auto semi = s.find(';', i);
    if (semi == std::string_view::npos || semi - i > 10) {
      out += s[i];
      continue;
    }
    auto name = s.substr(i + 1, semi - i - 1);
    std::string_view replacement;
    if (name == "amp") replacement = "&";
    else if (name == "lt") replacement = "<";
    else if (name == "gt") replacement = ">";
    else if (name == "quot") replacement = "\"";
    else if (name == "apos") replacement = "'";
    else if (name == "nbsp") replacement = " ";

    if (!replacement.empty()) {
      out += replacement;
      i = semi;
      continue;
    }
    if (name.size() > 1 && name[0] == '#') {
      bool hex = name[1] == 'x' || name[1] == 'X';
      auto digits = name.substr(hex ? 2 : 1);
      unsigned long cp{};
      auto [ptr, ec] = std::from_chars(
          digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10);
      if (ec == std::errc{} && ptr == digits.data() + digits.size() &&
          !digits.empty()) {
        append_utf8(out, cp);
        i = semi;
        continue;
      }
    }
    out += s[i];
  }
  return out;
}

}  // namespace

duckduckgo_provider::duckduckgo_provider(std::chrono::seconds timeout)
    : timeout_{timeout} {}

std::string duckduckgo_provider::make_form(const search_query& query) {
  auto form = fmt::format("q={}&b=", utils::url_encode(query.text));
  form += fmt::format(
      "&kl={}", utils::url_encode(query.region.value_or("wt-wt")));
  if (query.safesearch) {
    std::string_view kp;
    switch (*query.safesearch) {
      case safesearch_level::strict: kp = "1"; break;
      case safesearch_level::moderate: kp = "-1"; break;
      case safesearch_level::off: kp = "-2"; break;
    }
    form += fmt::format("&kp={}", kp);
  }
  if (query.timelimit) form += fmt::format("&df={}", to_string(*query.timelimit));
  return form;
}

search_errc classify_transport_error(const boost::system::error_code& ec) {
  if (ec.category() == asio::error::get_ssl_category())
    return search_errc::fatal;
  return search_errc::network;
}

std::string duckduckgo_provider::fetch(const std::string& form) const {
  ssl::context ctx{ssl::context::tls_client};
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);
  ctx.set_verify_callback(ssl::host_name_verification(std::string{kHost}));

  asio::io_context ioc;
  auto future = asio::co_spawn(
      ioc, post_form(ctx, form, timeout_), asio::use_future);

  // The per-step expiry does not cover name resolution.
  ioc.run_for(timeout_ * 4);
  if (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
    ioc.stop();
    throw search_error{
      search_errc::network,
      fmt::format("search request timed out after {}s", timeout_.count())};
  }

  response_t res;
  try {
    res = future.get();
  } catch (const boost::system::system_error& e) {
    throw search_error{
      classify_transport_error(e.code()),
      fmt::format("{}: {}", e.code().category().name(), e.code().message())};
  }

  auto status = res.result_int();
  if (status == 202 || status == 403 || status == 429) {
    throw search_error{
      search_errc::fatal,
      fmt::format("DuckDuckGo rate limited the request (HTTP {})", status)};
  }
  if (status != 200) {
    throw search_error{
      search_errc::fatal, fmt::format("DuckDuckGo returned HTTP {}", status)};
  }
  return std::move(res.body());
}

std::vector<raw_record> duckduckgo_provider::text(const search_query& query) {
  static const RE2 region_re{R"([a-z]{2}-[a-z]{2})"};
  if (query.region && !RE2::FullMatch(*query.region, region_re)) {
    throw search_error{
      search_errc::unsupported_parameters,
      fmt::format("unsupported region '{}'", *query.region)};
  }

  auto html = fetch(make_form(query));
  LOG_DEBUG("ddg: {} bytes of HTML for '{}'", html.size(), query.text);
  return parse_result_page(html, query.count);
}

std::vector<raw_record> parse_result_page(std::string_view html, int limit) {
  static const RE2 anchor_re{
    R"re((?s)<a\s([^>]*class="[^"]*\bresult__a\b[^"]*"[^>]*)>(.*?)</a>)re"};
  static const RE2 href_re{R"re(\bhref="([^"]*)")re"};
  static const RE2 snippet_re{
    R"re((?s)class="[^"]*\bresult__snippet\b[^"]*"[^>]*>(.*?)</(?:a|div|td)>)re"};
  static const RE2 no_results_re{R"re((?i)class="no-results"|No\s+results\.)re"};

  struct anchor {
    std::string attrs;
    std::string title;
    size_t begin;
    size_t end;
  };
  std::vector<anchor> anchors;

  auto str = [](const re2::StringPiece& sp) {
    return std::string{sp.data(), sp.size()};
  };
  re2::StringPiece text{html.data(), html.size()};
  std::array<re2::StringPiece, 3> m;
  size_t pos{0};
  while (pos < html.size() &&
         anchor_re.Match(
             text, pos, html.size(), RE2::UNANCHORED, m.data(),
             static_cast<int>(m.size()))) {
    auto begin = static_cast<size_t>(m[0].data() - html.data());
    auto end = begin + m[0].size();
    anchors.push_back({str(m[1]), str(m[2]), begin, end});
    pos = end;
  }

  if (anchors.empty()) {
    if (RE2::PartialMatch(text, no_results_re)) return {};
    throw search_error{
      search_errc::formatting_defect, "unrecognized DuckDuckGo result page"};
  }

  std::vector<raw_record> records;
  for (size_t i = 0; i < anchors.size(); ++i) {
    if (static_cast<int>(records.size()) >= limit) break;
    const auto& a = anchors[i];

    std::string href;
    RE2::PartialMatch(a.attrs, href_re, &href);
    href = unwrap_redirect(decode_entities(href));
    if (href.find("duckduckgo.com/y.js") != std::string::npos) continue;

    size_t segment_end =
        i + 1 < anchors.size() ? anchors[i + 1].begin : html.size();
    auto segment = html.substr(a.end, segment_end - a.end);
    std::string snippet;
    RE2::PartialMatch(
        re2::StringPiece{segment.data(), segment.size()}, snippet_re,
        &snippet);

    records.push_back({html_to_text(a.title), href, html_to_text(snippet)});
  }
  return records;
}

std::string unwrap_redirect(std::string_view href) {
  std::string out{href};
  if (auto pos = href.find("uddg="); pos != std::string_view::npos) {
    auto value = href.substr(pos + 5);
    value = value.substr(0, value.find('&'));
    out = utils::url_decode(value);
  } else if (href.starts_with("//")) {
    out = fmt::format("https:{}", href);
  }
  return out;
}

std::string html_to_text(std::string_view html) {
  static const RE2 tag_re{R"(<[^>]*>)"};
  std::string text{html};
  RE2::GlobalReplace(&text, tag_re, "");
  return decode_entities(text);
}

}  // namespace duckmcp
