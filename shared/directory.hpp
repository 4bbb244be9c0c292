#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "registration-result.hpp"
#include "registry.hpp"
#include "type-info.hpp"

namespace dlchain {

/// @brief The process-wide table of interception registries, keyed by symbol name.
/// Registries are added at load time by the interception macros (see interceptor.hpp), before their entry points can be
/// reached from user code. Neither the directory nor its registries are ever destroyed, so entry points remain valid
/// while other objects run their static destructors at exit.
class Directory {
 public:
  static Directory& Get();

  /// @brief Adds a registry under its symbol name. Aborts if a registry with that name already exists.
  void add(RegistryBase& registry);

  /// @brief Returns the registry for symbol, or nullptr if the symbol is not intercepted.
  [[nodiscard]] RegistryBase* find(std::string_view symbol) const;

  /// @brief All intercepted symbol names, sorted.
  [[nodiscard]] std::vector<std::string> symbols() const;

 private:
  Directory() = default;

  mutable std::mutex mutex_;
  std::map<std::string_view, RegistryBase*, std::less<>> registries_;
};

/// @brief Checks that incoming describes the same signature as existing.
[[nodiscard]] Result<std::monostate, registration::SignatureMismatch> ValidateSignature(
    std::string_view symbol, SignatureInfo const& existing, SignatureInfo const& incoming);

/// @brief Finds the registry for symbol and checks that it has signature R(TArgs...).
template <class Sig>
struct FindRegistryImpl;

template <class R, class... TArgs>
struct FindRegistryImpl<R(TArgs...)> {
  using ResultT = Result<Registry<R(TArgs...)>*, registration::Error>;

  static ResultT find(std::string_view symbol) {
    auto* base = Directory::Get().find(symbol);
    if (base == nullptr) {
      return ResultT::template ErrAt<registration::UnknownSymbol>(symbol);
    }
#ifndef DLCHAIN_NO_REGISTRATION_CHECKS
    auto checks = ValidateSignature(symbol, base->signature(), SignatureInfo::from<R, TArgs...>());
    if (!checks.has_value()) {
      return ResultT::template ErrAt<registration::SignatureMismatch>(checks.error());
    }
#endif
    // Descriptors cannot see every difference between two signatures; the registry's dynamic type can
    auto* registry = dynamic_cast<Registry<R(TArgs...)>*>(base);
    if (registry == nullptr) {
      return ResultT::template ErrAt<registration::SignatureMismatch>(
          std::in_place_type_t<registration::MismatchRegistryType>{}, symbol, typeid(*base).name(),
          typeid(Registry<R(TArgs...)>).name());
    }
    return ResultT::Ok(registry);
  }
};

template <class Sig>
[[nodiscard]] Result<Registry<Sig>*, registration::Error> FindRegistry(std::string_view symbol) {
  return FindRegistryImpl<Sig>::find(symbol);
}

/// @brief Lists every intercepted symbol name, sorted.
[[nodiscard]] inline std::vector<std::string> RegisteredSymbols() {
  return Directory::Get().symbols();
}

}  // namespace dlchain
