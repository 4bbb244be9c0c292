#pragma once

#include <fmt/format.h>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace dlchain {
/// @brief How a parameter or return type is passed: by value, or by lvalue / rvalue reference.
enum struct ReferenceKind : unsigned char {
  None,
  Lvalue,
  Rvalue,
};

/// @brief Represents the type info for a single parameter or return type of an intercepted symbol
struct TypeInfo {
  std::size_t size{};
  /// @brief Implementation-defined type name (typeid), used to tell apart types of equal size.
  /// For references this is the name of a pointer to the referenced type, which keeps its cv qualifiers.
  std::string_view name{};
  ReferenceKind reference{ ReferenceKind::None };

  template <class T>
  [[nodiscard]] static TypeInfo from() {
    if constexpr (std::is_reference_v<T>) {
      return TypeInfo{
        .size = sizeof(void*),
        .name = typeid(std::remove_reference_t<T>*).name(),
        .reference = std::is_lvalue_reference_v<T> ? ReferenceKind::Lvalue : ReferenceKind::Rvalue,
      };
    } else if constexpr (std::is_void_v<T>) {
      return TypeInfo{
        .size = 0,
        .name = typeid(void).name(),
      };
    } else {
      return TypeInfo{
        .size = sizeof(T),
        .name = typeid(T).name(),
      };
    }
  }
};

inline bool operator==(TypeInfo const& lhs, TypeInfo const& rhs) {
  return lhs.size == rhs.size && lhs.name == rhs.name && lhs.reference == rhs.reference;
}

/// @brief The signature descriptor of an intercepted symbol: its return type and parameter types, in order.
struct SignatureInfo {
  TypeInfo return_info;
  std::vector<TypeInfo> parameter_info;

  template <class R, class... TArgs>
  [[nodiscard]] static SignatureInfo from() {
    return SignatureInfo{
      .return_info = TypeInfo::from<R>(),
      .parameter_info = { TypeInfo::from<TArgs>()... },
    };
  }
};

}  // namespace dlchain

// Custom formatter for dlchain::TypeInfo
template <>
class fmt::formatter<dlchain::TypeInfo> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(dlchain::TypeInfo const& info, Context& ctx) const {
    switch (info.reference) {
      case dlchain::ReferenceKind::Lvalue:
        return fmt::format_to(ctx.out(), "({} as &, size={})", info.name, info.size);
      case dlchain::ReferenceKind::Rvalue:
        return fmt::format_to(ctx.out(), "({} as &&, size={})", info.name, info.size);
      default:
        return fmt::format_to(ctx.out(), "({}, size={})", info.name, info.size);
    }
  }
};
