#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// Queries whose result should be used in some way.
#define DLCHAIN_C_EXPORT __attribute__((visibility("default"))) __attribute__((warn_unused_result))
#define DLCHAIN_C_EXPORT_VOID __attribute__((visibility("default")))
// The dlchain C API. Hooks themselves are registered from C++; this API covers the control state and introspection,
// for payloads and tools written in C.

#ifdef __cplusplus
extern "C" {
#endif

/// @brief Enables chain dispatch for every intercepted symbol on every thread. Idempotent.
DLCHAIN_C_EXPORT_VOID void dlchain_enable_hooks(void);

/// @brief Disables chain dispatch for every intercepted symbol on every thread: calls go straight to the original.
/// Idempotent.
DLCHAIN_C_EXPORT_VOID void dlchain_disable_hooks(void);

/// @brief Returns the process-wide enabled flag.
DLCHAIN_C_EXPORT bool dlchain_hooks_enabled(void);

/// @brief Enters a bypass scope on the calling thread. Every intercepted call made by this thread goes straight to
/// the original until the matching dlchain_bypass_leave. Scopes nest.
DLCHAIN_C_EXPORT_VOID void dlchain_bypass_enter(void);

/// @brief Leaves the innermost bypass scope of the calling thread. Returns false (and does nothing) if the thread is
/// not inside a bypass scope.
DLCHAIN_C_EXPORT bool dlchain_bypass_leave(void);

/// @brief Returns the bypass depth of the calling thread.
DLCHAIN_C_EXPORT uint32_t dlchain_bypass_depth(void);

/// @brief Returns true if symbol has an interception registry in this process.
DLCHAIN_C_EXPORT bool dlchain_is_intercepted(char const* symbol);

/// @brief Returns the number of hooks registered on symbol. Returns 0 if none or if symbol is not intercepted.
DLCHAIN_C_EXPORT size_t dlchain_get_hook_count(char const* symbol);

/// @brief Returns the original implementation of an intercepted symbol, resolving it if needed, or NULL if symbol is
/// not intercepted. The process aborts if symbol is intercepted but has no original definition.
DLCHAIN_C_EXPORT void* dlchain_resolve_original(char const* symbol);

/// @brief Writes the NUL-terminated names of up to capacity intercepted symbols, sorted, into buffer (each at most
/// name_size bytes, truncated) and returns the total number of intercepted symbols.
DLCHAIN_C_EXPORT size_t dlchain_get_symbols(char* buffer, size_t name_size, size_t capacity);

#ifdef __cplusplus
}
#endif
