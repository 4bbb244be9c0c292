#include "config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <string_view>

#include "util.hpp"

namespace dlchain {

bool Config::IsTruthy(char const* value) {
  if (value == nullptr) return false;
  // Read from noexcept code on first dispatch, so no allocation here
  std::string_view const text(value);
  constexpr std::array<std::string_view, 4> kTruthy{ "1", "true", "yes", "on" };
  for (auto const candidate : kTruthy) {
    if (std::equal(text.begin(), text.end(), candidate.begin(), candidate.end(), [](char lhs, char rhs) {
          return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
        })) {
      return true;
    }
  }
  return false;
}

Config Config::FromEnvironment(char const* (*lookup)(char const*)) {
  return Config{
    .start_disabled = IsTruthy(lookup("DLCHAIN_DISABLED")),
    .verbose = IsTruthy(lookup("DLCHAIN_VERBOSE")),
  };
}

Config const& Config::Get() {
  static Config const config = FromEnvironment([](char const* name) -> char const* { return std::getenv(name); });
  return config;
}

}  // namespace dlchain

namespace dlchain::log {

bool Verbose() noexcept {
  return Config::Get().verbose;
}

void WriteLine(char const* level, std::string_view message) noexcept {
  // Single write per line, so lines from concurrent threads do not interleave mid-line
  try {
    auto line = fmt::format(DLCHAIN_ID "|v" DLCHAIN_VERSION " [{}] {}\n", level, message);
    std::fwrite(line.data(), 1, line.size(), stderr);
  } catch (std::exception const&) {
    std::fputs(DLCHAIN_ID ": failed to format log line\n", stderr);
  }
}

}  // namespace dlchain::log
