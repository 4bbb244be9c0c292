#pragma once

#include <fmt/format.h>
#include <string>

namespace dlchain {

/// @brief Describes the name metadata of a hook. Purely diagnostic: names never influence chain order.
struct HookNameMetadata {
  std::string name{};
  std::string namespaze{};

  /// @brief Checks if this name metadata matches another (either by name or namespace)
  [[nodiscard]] bool matches(HookNameMetadata const& other) const {
    return (!name.empty() && name == other.name) || (!namespaze.empty() && namespaze == other.namespaze);
  }
};

inline bool operator==(HookNameMetadata const& lhs, HookNameMetadata const& rhs) {
  return lhs.name == rhs.name && lhs.namespaze == rhs.namespaze;
}

}  // namespace dlchain

// Custom formatter for dlchain::HookNameMetadata
template <>
class fmt::formatter<dlchain::HookNameMetadata> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(dlchain::HookNameMetadata const& metadata, Context& ctx) const {
    if (metadata.namespaze.empty()) {
      return fmt::format_to(ctx.out(), "name: {}", metadata.name);
    }
    return fmt::format_to(ctx.out(), "name: {}::{}", metadata.namespaze, metadata.name);
  }
};
