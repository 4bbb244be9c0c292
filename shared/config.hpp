#pragma once

#include <string_view>

namespace dlchain {

/// @brief Runtime configuration, read once from the environment of the intercepted process.
/// DLCHAIN_DISABLED: start with every hook chain globally disabled until EnableHooks() is called. Applied when the
/// enabled flag is first read, unless EnableHooks() or DisableHooks() already ran (from a payload constructor, say).
/// DLCHAIN_VERBOSE: emit the debug log stream (registrations, resolutions, control transitions).
struct Config {
  bool start_disabled{ false };
  bool verbose{ false };

  /// @brief Returns the process configuration. The environment is read on first use only.
  static Config const& Get();

  /// @brief Builds a configuration from an arbitrary environment lookup (a getenv-like function).
  static Config FromEnvironment(char const* (*lookup)(char const*));

  /// @brief Returns true for "1", "true", "yes" and "on" (case-insensitive).
  [[nodiscard]] static bool IsTruthy(char const* value);
};

}  // namespace dlchain
