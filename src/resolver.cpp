#include "resolver.hpp"

#include <dlfcn.h>

#include "util.hpp"

namespace dlchain {

void* LookupNext(char const* symbol) {
  // Clear any stale error so that a failure below reports this lookup
  static_cast<void>(::dlerror());
  return ::dlsym(RTLD_NEXT, symbol);
}

void* ResolveOrAbort(char const* symbol, LookupFunction lookup) {
  auto* resolved = lookup(symbol);
  if (resolved == nullptr) {
    char const* error = ::dlerror();
    DLCHAIN_ABORT("Unable to resolve the original definition of symbol: {} ({}). Refusing to call through a null "
                  "original.",
                  symbol, error != nullptr ? error : "no next definition in load order");
  }
  DLCHAIN_DEBUG("Resolved original for symbol: {} at: {}", symbol, fmt::ptr(resolved));
  return resolved;
}

}  // namespace dlchain
