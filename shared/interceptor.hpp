#pragma once

#include <string_view>
#include <utility>

#include "control.hpp"
#include "directory.hpp"
#include "hook-metadata.hpp"
#include "registration-result.hpp"
#include "registry.hpp"
#include "util.hpp"

// Public engine API.
//
// Hooks are called outermost first, in registration order. A hook that needs the real behavior of the very symbol it
// intercepts must use call_orig (or the chain's call_orig), or wrap the call in a BypassScope / BypassHooks; calling
// the symbol itself from its own hook re-enters the chain and recurses without bound.

namespace dlchain {

/// @brief Creates the registry for symbol and adds it to the process-wide Directory. The registry is never destroyed.
template <class Sig>
Registry<Sig>& MakeRegistry(char const* symbol) {
  auto* registry = new Registry<Sig>(symbol);
  Directory::Get().add(*registry);
  return *registry;
}

/// @brief Appends hook to the chain of registry.
template <class R, class... TArgs>
[[nodiscard]] registration::Result AddHook(Registry<R(TArgs...)>& registry,
                                           typename Registry<R(TArgs...)>::FunctionType hook,
                                           HookNameMetadata name_info = {}) {
  return registry.add_hook(std::move(hook), std::move(name_info));
}

/// @brief Appends hook to the chain of the symbol named symbol, after checking its signature is Sig.
template <class Sig>
[[nodiscard]] registration::Result AddHook(std::string_view symbol, typename Registry<Sig>::FunctionType hook,
                                           HookNameMetadata name_info = {}) {
  auto registry = FindRegistry<Sig>(symbol);
  if (!registry.has_value()) {
    return registration::Result::Err(registry.error());
  }
  return registry.value()->add_hook(std::move(hook), std::move(name_info));
}

/// @brief Calls the original implementation behind registry, bypassing every hook.
template <class R, class... TArgs, class... UArgs>
R CallOrig(Registry<R(TArgs...)>& registry, UArgs&&... args) {
  return registry.call_orig(std::forward<UArgs>(args)...);
}

}  // namespace dlchain

/// @brief Declares the registry accessor dlchain::symbols::symbol_() of a symbol intercepted in another translation
/// unit.
#define DLCHAIN_DECLARE_INTERCEPT(ret_, symbol_, params_) \
  namespace dlchain::symbols {                            \
  ::dlchain::Registry<ret_ params_>& symbol_();           \
  }

/// @brief Intercepts symbol_, with return type ret_ and parenthesized parameter list params_.
/// args_ is the parenthesized list of parameter names, forwarded to the chain in order.
/// Defines the registry accessor dlchain::symbols::symbol_() and the extern "C" entry point ret_ symbol_ params_. The
/// registry is created and added to the Directory during static initialization of the defining object, or by the
/// first call through the entry point if that happens earlier.
/// Example: DLCHAIN_INTERCEPT(ssize_t, read, (int fd, void* buf, size_t count), (fd, buf, count))
#define DLCHAIN_INTERCEPT(ret_, symbol_, params_, args_)                                \
  namespace dlchain::symbols {                                                          \
  ::dlchain::Registry<ret_ params_>& symbol_() {                                        \
    static auto& registry = ::dlchain::MakeRegistry<ret_ params_>(#symbol_);            \
    return registry;                                                                    \
  }                                                                                     \
  namespace {                                                                           \
  [[maybe_unused]] ::dlchain::Registry<ret_ params_>& symbol_##_load_time = symbol_(); \
  }                                                                                     \
  }                                                                                     \
  extern "C" DLCHAIN_EXPORT ret_ symbol_ params_ {                                      \
    return ::dlchain::symbols::symbol_().dispatch args_;                                \
  }
