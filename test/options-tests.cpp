#include <doctest/doctest.h>

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

#include "duckmcp/config.hpp"

using namespace duckmcp;

namespace {

// argv-style view over owned strings.
struct command_line {
  std::vector<std::string> storage;
  std::vector<char*> argv;

  command_line(std::initializer_list<std::string> args)
      : storage{"duckmcp-server"} {
    storage.insert(storage.end(), args.begin(), args.end());
    for (auto& s : storage) argv.push_back(s.data());
  }
};

// Sets an environment variable for the lifetime of the object.
struct scoped_env {
  std::string name;
  scoped_env(std::string n, const char* value) : name{std::move(n)} {
    ::setenv(name.c_str(), value, 1);
  }
  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;
  scoped_env(scoped_env&&) = delete;
  scoped_env& operator=(scoped_env&&) = delete;
  ~scoped_env() { ::unsetenv(name.c_str()); }
};

}  // namespace

TEST_CASE("options-defaults") {
  command_line cl{};
  settings s;
  CHECK_FALSE(parse_options(cl.argv, s).has_value());
  CHECK(s.host == "0.0.0.0");
  CHECK(s.port == 8000);
  CHECK(s.workers == 4);
  CHECK(s.search_timeout == 30);
  CHECK(s.cache_enabled);
  CHECK(s.cache_ttl == 3600);
  CHECK(s.cache_max_size == 1000);
  CHECK(s.log_level == logger::level::info);
  CHECK(s.cors_enabled);
  CHECK_NOTHROW(validate(s));
}

TEST_CASE("options-command-line") {
  command_line cl{
    "--host", "127.0.0.1", "-p", "9000", "--cache-enabled", "false",
    "--cache-max-size", "5", "--log-level", "DEBUG", "--cors", "false"};
  settings s;
  CHECK_FALSE(parse_options(cl.argv, s).has_value());
  CHECK(s.host == "127.0.0.1");
  CHECK(s.port == 9000);
  CHECK_FALSE(s.cache_enabled);
  CHECK(s.cache_max_size == 5);
  CHECK(s.log_level == logger::level::debug);
  CHECK_FALSE(s.cors_enabled);
}

TEST_CASE("options-environment") {
  scoped_env port{"MCP_PORT", "8123"};
  scoped_env ttl{"MCP_CACHE_TTL", "60"};

  SUBCASE("environment fills in") {
    command_line cl{};
    settings s;
    CHECK_FALSE(parse_options(cl.argv, s).has_value());
    CHECK(s.port == 8123);
    CHECK(s.cache_ttl == 60);
  }
  SUBCASE("command line wins") {
    command_line cl{"--port", "9001"};
    settings s;
    CHECK_FALSE(parse_options(cl.argv, s).has_value());
    CHECK(s.port == 9001);
    CHECK(s.cache_ttl == 60);
  }
}

TEST_CASE("options-rejects-bad-values") {
  settings s;
  SUBCASE("port out of range") {
    command_line cl{"--port", "70000"};
    auto code = parse_options(cl.argv, s);
    REQUIRE(code.has_value());
    CHECK(*code != 0);
  }
  SUBCASE("unknown log level") {
    command_line cl{"--log-level", "loud"};
    auto code = parse_options(cl.argv, s);
    REQUIRE(code.has_value());
    CHECK(*code != 0);
  }
  SUBCASE("help exits cleanly") {
    command_line cl{"--help"};
    auto code = parse_options(cl.argv, s);
    REQUIRE(code.has_value());
    CHECK(*code == 0);
  }
}

TEST_CASE("validate-settings") {
  settings s;
  CHECK_NOTHROW(validate(s));

  SUBCASE("workers") {
    s.workers = 0;
    CHECK_THROWS_AS(validate(s), config_error);
  }
  SUBCASE("timeout") {
    s.search_timeout = 0;
    CHECK_THROWS_AS(validate(s), config_error);
  }
  SUBCASE("enabled cache needs a ttl") {
    s.cache_ttl = 0;
    CHECK_THROWS_AS(validate(s), config_error);
  }
  SUBCASE("enabled cache needs capacity") {
    s.cache_max_size = 0;
    CHECK_THROWS_AS(validate(s), config_error);
  }
  SUBCASE("disabled cache is not checked") {
    s.cache_enabled = false;
    s.cache_ttl = 0;
    s.cache_max_size = 0;
    CHECK_NOTHROW(validate(s));
  }
}
