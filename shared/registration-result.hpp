#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "hook-metadata.hpp"
#include "type-info.hpp"
#include "util.hpp"

namespace dlchain {

template <class T>
struct is_variant {
  constexpr static bool value = false;
};

template <class... TArgs>
struct is_variant<std::variant<TArgs...>> {
  constexpr static bool value = true;
};

template <class T, class E>
struct Result {
  std::variant<E, T> data;
  template <class... TArgs>
  static Result Ok(TArgs&&... args) {
    return Result{ std::variant<E, T>(std::in_place_index_t<1>{}, std::forward<TArgs>(args)...) };
  }
  template <class... TArgs>
  static Result Err(TArgs&&... args) {
    return Result{ std::variant<E, T>(std::in_place_index_t<0>{}, std::forward<TArgs>(args)...) };
  }
  // Helper function for if E is a variant (we have multiple errors and need to construct one)
  template <class ET, class... TArgs>
    requires(is_variant<E>::value)
  static Result ErrAt(TArgs&&... args) {
    return Result{ std::variant<E, T>(std::in_place_index_t<0>{},
                                      E(std::in_place_type_t<ET>{}, std::forward<TArgs>(args)...)) };
  }
  T const& value() const {
    return std::get<1>(data);
  }
  E const& error() const {
    return std::get<0>(data);
  }
  bool has_value() const {
    return data.index() == 1;
  }
};

namespace registration {

/// @brief Holds metadata about a successful hook registration
struct Ok {
  /// @brief The position of the new hook in the chain at the time it was added (0 is outermost).
  std::size_t index;
};

/// @brief The general base type for reporting registration errors. Holds the symbol being registered against.
struct SymbolErrorInfo {
  std::string symbol;
  SymbolErrorInfo(std::string_view s) : symbol(s) {}
};

/// @brief No registry exists for the requested symbol name.
struct UnknownSymbol : SymbolErrorInfo {
  UnknownSymbol(std::string_view s) : SymbolErrorInfo(s) {}
};

/// @brief The hook callable was empty.
struct NullHook : SymbolErrorInfo {
  NullHook(std::string_view s, HookNameMetadata const& m) : SymbolErrorInfo(s), hook(m) {}
  HookNameMetadata hook;
};

struct MismatchReturn : SymbolErrorInfo {
  MismatchReturn(std::string_view s, TypeInfo existing, TypeInfo incoming)
      : SymbolErrorInfo(s), existing(existing), incoming(incoming) {}
  TypeInfo existing;
  TypeInfo incoming;
};

struct MismatchParam : SymbolErrorInfo {
  MismatchParam(std::string_view s, size_t idx, TypeInfo existing, TypeInfo incoming)
      : SymbolErrorInfo(s), idx(idx), existing(existing), incoming(incoming) {}
  size_t idx{};
  TypeInfo existing{};
  TypeInfo incoming{};
};

struct MismatchParamCount : SymbolErrorInfo {
  MismatchParamCount(std::string_view s, size_t existing, size_t incoming)
      : SymbolErrorInfo(s), existing(existing), incoming(incoming) {}
  size_t existing;
  size_t incoming;
};

/// @brief The descriptors agree but the registry is a different Registry instantiation (for example only the
/// cv-qualification of a by-value return type differs, or descriptor checks are compiled out).
struct MismatchRegistryType : SymbolErrorInfo {
  MismatchRegistryType(std::string_view s, std::string_view existing, std::string_view incoming)
      : SymbolErrorInfo(s), existing(existing), incoming(incoming) {}
  std::string_view existing;
  std::string_view incoming;
};

/// @brief The signature requested by a lookup by name disagrees with the registry's signature.
using SignatureMismatch = std::variant<MismatchReturn, MismatchParam, MismatchParamCount, MismatchRegistryType>;

// Can be one of many cases.
using Error = std::variant<UnknownSymbol, NullHook, SignatureMismatch>;

using Result = dlchain::Result<Ok, Error>;

}  // namespace registration

}  // namespace dlchain

// Custom formatter for dlchain::registration::SignatureMismatch
template <>
class fmt::formatter<dlchain::registration::SignatureMismatch> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(dlchain::registration::SignatureMismatch const& mismatch, Context& ctx) const {
    using namespace dlchain::registration;
    return std::visit(
        dlchain::util::overload{
          [&](MismatchReturn const& mismatch_return) {
            return fmt::format_to(ctx.out(), "Symbol {} has return type: {} but specified: {}", mismatch_return.symbol,
                                  mismatch_return.existing, mismatch_return.incoming);
          },
          [&](MismatchParam const& mismatch_param) {
            return fmt::format_to(ctx.out(), "Symbol {} has parameter {} type: {} but specified: {}",
                                  mismatch_param.symbol, mismatch_param.idx, mismatch_param.existing,
                                  mismatch_param.incoming);
          },
          [&](MismatchParamCount const& mismatch_param_count) {
            return fmt::format_to(ctx.out(), "Symbol {} has {} parameters but specified: {}",
                                  mismatch_param_count.symbol, mismatch_param_count.existing,
                                  mismatch_param_count.incoming);
          },
          [&](MismatchRegistryType const& mismatch_type) {
            return fmt::format_to(ctx.out(), "Symbol {} has registry type: {} but specified: {}", mismatch_type.symbol,
                                  mismatch_type.existing, mismatch_type.incoming);
          },
        },
        mismatch);
  }
};

// Custom formatter for dlchain::registration::Error
template <>
class fmt::formatter<dlchain::registration::Error> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(dlchain::registration::Error const& error, Context& ctx) const {
    using namespace dlchain::registration;
    return std::visit(
        dlchain::util::overload{
          [&ctx](UnknownSymbol const& unknown) {
            return fmt::format_to(ctx.out(), "No interception registry for symbol: {}", unknown.symbol);
          },
          [&ctx](NullHook const& null_hook) {
            return fmt::format_to(ctx.out(), "Null hook for symbol: {}, hook: {}", null_hook.symbol, null_hook.hook);
          },
          [&ctx](SignatureMismatch const& mismatch) {
            return fmt::format_to(ctx.out(), "Signature mismatch: {}", mismatch);
          } },
        error);
  }
};
