#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <utility>

#define DLCHAIN_ID "dlchain"
#define DLCHAIN_VERSION "0.1.0"

#define DLCHAIN_EXPORT __attribute__((visibility("default")))

namespace dlchain::log {

/// @brief Returns true if the runtime debug stream is enabled (DLCHAIN_VERBOSE).
bool Verbose() noexcept;

/// @brief Writes a single, already formatted line to stderr with the library prefix.
void WriteLine(char const* level, std::string_view message) noexcept;

/// @brief Formats and writes one log line. Formatting failures are reported in place of the line, so logging from
/// noexcept code never terminates the process.
template <class... TArgs>
void Write(char const* level, fmt::format_string<TArgs...> format, TArgs&&... args) noexcept {
  try {
    WriteLine(level, fmt::format(format, std::forward<TArgs>(args)...));
  } catch (std::exception const&) {
    WriteLine(level, "failed to format log line");
  }
}

}  // namespace dlchain::log

#define DLCHAIN_LOG(lvl, ...) ::dlchain::log::Write(lvl, __VA_ARGS__)

#if !defined(NDEBUG) && !defined(DLCHAIN_NO_DEBUG_LOGS)
#define DLCHAIN_ASSERT(...)                                                   \
  do {                                                                        \
    if (!(__VA_ARGS__)) DLCHAIN_ABORT("Failed condition: {}", #__VA_ARGS__); \
  } while (0)
#define DLCHAIN_DEBUG(...)                                      \
  do {                                                          \
    if (::dlchain::log::Verbose()) DLCHAIN_LOG("D", __VA_ARGS__); \
  } while (0)
#else
#define DLCHAIN_ASSERT(...) \
  do {                    \
  } while (0)
#define DLCHAIN_DEBUG(...)
#endif

#define DLCHAIN_CRITICAL(...) DLCHAIN_LOG("C", __VA_ARGS__)
#define DLCHAIN_ABORT(...)             \
  do {                                 \
    DLCHAIN_CRITICAL(__VA_ARGS__);     \
    std::fflush(stderr);               \
    std::abort();                      \
  } while (0)

namespace dlchain::util {

/// @brief Visitor helper for std::visit over the error variants.
template <class... Ts>
struct overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace dlchain::util
