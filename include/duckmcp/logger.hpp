#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <mutex>
#include <optional>
#include <print>
#include <source_location>
#include <string>
#include <string_view>

namespace duckmcp::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

// Accepts the names printed by level_to_string, in any case, plus "warn".
inline std::optional<level> level_from_string(std::string_view name) {
  std::string lower{name};
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "trace") return level::trace;
  if (lower == "debug") return level::debug;
  if (lower == "info") return level::info;
  if (lower == "warning" || lower == "warn") return level::warning;
  if (lower == "error") return level::error;
  if (lower == "fatal" || lower == "critical") return level::fatal;
  return std::nullopt;
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }

// Worker threads log concurrently; one line at a time.
inline std::mutex& output_mutex() {
  static std::mutex m;
  return m;
}

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ymd = year_month_day{floor<days>(now)};
  auto hms = hh_mm_ss{floor<milliseconds>(now - floor<days>(now))};

  return std::format("{} {}", ymd, hms);
}

// Core logging function
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    std::format_string<Args...> fmt, Args&&... args) {
  if (level > global_level) return;

  auto line = std::format(
      "{} {}:{} {}: {}", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().c_str(),
      location.line(), level_to_string(level),
      std::format(fmt, std::forward<Args>(args)...));
  std::lock_guard<std::mutex> lock{output_mutex()};
  std::println("{}", line);
  std::fflush(stdout);
}

}  // namespace duckmcp::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                                \
  duckmcp::logger::log(                                               \
      duckmcp::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                                \
  duckmcp::logger::log(                                               \
      duckmcp::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                                \
  duckmcp::logger::log(                                              \
      duckmcp::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                   \
  duckmcp::logger::log(                                                 \
      duckmcp::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                                \
  duckmcp::logger::log(                                               \
      duckmcp::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                                \
  duckmcp::logger::log(                                               \
      duckmcp::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
