#include "capi.h"
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include "control.hpp"
#include "directory.hpp"
#include "registry.hpp"
#include "util.hpp"

namespace {

dlchain::RegistryBase* find_registry(char const* symbol) {
  if (symbol == nullptr) return nullptr;
  return dlchain::Directory::Get().find(std::string_view(symbol));
}

}  // namespace

DLCHAIN_C_EXPORT_VOID void dlchain_enable_hooks(void) {
  dlchain::EnableHooks();
}

DLCHAIN_C_EXPORT_VOID void dlchain_disable_hooks(void) {
  dlchain::DisableHooks();
}

DLCHAIN_C_EXPORT bool dlchain_hooks_enabled(void) {
  return dlchain::HooksEnabled();
}

DLCHAIN_C_EXPORT_VOID void dlchain_bypass_enter(void) {
  dlchain::detail::EnterBypass();
}

DLCHAIN_C_EXPORT bool dlchain_bypass_leave(void) {
  return dlchain::detail::LeaveBypass();
}

DLCHAIN_C_EXPORT uint32_t dlchain_bypass_depth(void) {
  return dlchain::BypassDepth();
}

DLCHAIN_C_EXPORT bool dlchain_is_intercepted(char const* symbol) {
  return find_registry(symbol) != nullptr;
}

DLCHAIN_C_EXPORT size_t dlchain_get_hook_count(char const* symbol) {
  auto* registry = find_registry(symbol);
  return registry != nullptr ? registry->hook_count() : 0;
}

DLCHAIN_C_EXPORT void* dlchain_resolve_original(char const* symbol) {
  auto* registry = find_registry(symbol);
  return registry != nullptr ? registry->original_pointer() : nullptr;
}

DLCHAIN_C_EXPORT size_t dlchain_get_symbols(char* buffer, size_t name_size, size_t capacity) {
  auto const symbols = dlchain::Directory::Get().symbols();
  if (buffer == nullptr || name_size == 0) return symbols.size();
  for (size_t i = 0; i < symbols.size() && i < capacity; i++) {
    auto [out, _] = fmt::format_to_n(buffer + i * name_size, name_size - 1, "{}", symbols[i]);
    *out = '\0';  // Suffix with a null
  }
  return symbols.size();
}
