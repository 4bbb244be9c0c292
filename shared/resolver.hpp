#pragma once

#include <atomic>
#include <mutex>
#include <string_view>

namespace dlchain {

/// @brief A lookup that maps an exported symbol name to an address, or nullptr if it cannot be found.
using LookupFunction = void* (*)(char const* symbol);

/// @brief Looks up the NEXT definition of symbol in load order, skipping the object that owns this code.
/// This is dlsym(RTLD_NEXT, symbol), so dlchain must be linked into the object that defines the interception entry
/// points (it is built as a static library for this reason).
/// @return The address of the next definition, or nullptr if there is none.
void* LookupNext(char const* symbol);

/// @brief Resolves the next definition of symbol through lookup, aborting the process when it cannot be found.
/// Calling through an unresolved original would jump to 0, so there is no recoverable failure here.
void* ResolveOrAbort(char const* symbol, LookupFunction lookup);

/// @brief The lazily resolved, cached pointer to the original implementation of one symbol.
/// Resolution happens at most once per slot: the first caller performs the lookup while concurrent callers wait on it,
/// then the pointer is published atomically and every later read is a single acquire load.
class OriginalSlot {
 public:
  /// @param symbol NUL-terminated symbol name. Must outlive the slot (in practice a string literal).
  explicit OriginalSlot(char const* symbol, LookupFunction lookup = &LookupNext) : symbol_(symbol), lookup_(lookup) {}

  OriginalSlot(OriginalSlot const&) = delete;
  OriginalSlot& operator=(OriginalSlot const&) = delete;

  /// @brief Returns the original pointer, resolving it on first use. Never returns nullptr.
  [[nodiscard]] void* get() {
    if (auto* resolved = resolved_.load(std::memory_order_acquire)) {
      return resolved;
    }
    std::call_once(once_, [this] { resolved_.store(ResolveOrAbort(symbol_, lookup_), std::memory_order_release); });
    return resolved_.load(std::memory_order_acquire);
  }

  /// @brief Returns the cached pointer without resolving, or nullptr if no call has resolved it yet.
  [[nodiscard]] void* peek() const {
    return resolved_.load(std::memory_order_acquire);
  }

  [[nodiscard]] std::string_view symbol() const {
    return symbol_;
  }

 private:
  char const* symbol_;
  LookupFunction lookup_;
  std::once_flag once_;
  std::atomic<void*> resolved_{ nullptr };
};

}  // namespace dlchain
