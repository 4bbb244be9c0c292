#pragma once

#include <cstdint>
#include <utility>

namespace dlchain {

/// @brief Globally enables chain dispatch for every symbol and every thread. Idempotent.
void EnableHooks() noexcept;

/// @brief Globally disables chain dispatch: every intercepted call goes straight to its original. Idempotent.
void DisableHooks() noexcept;

/// @brief Returns the process-wide enabled flag.
[[nodiscard]] bool HooksEnabled() noexcept;

/// @brief Returns the bypass depth of the calling thread (0 when not inside any bypass scope).
[[nodiscard]] std::uint32_t BypassDepth() noexcept;

/// @brief True if a dispatch starting now on this thread should walk its hook chain.
[[nodiscard]] bool ShouldDispatch() noexcept;

/// @brief Increments the calling thread's bypass depth for the lifetime of the object.
/// While any scope is alive on a thread, every intercepted call made by that thread calls its original directly.
/// Other threads are unaffected.
class BypassScope {
 public:
  BypassScope() noexcept;
  ~BypassScope();

  BypassScope(BypassScope const&) = delete;
  BypassScope& operator=(BypassScope const&) = delete;
};

/// @brief Runs body with hooks bypassed on the calling thread and returns its result.
/// The depth is restored when body returns or throws. Scopes nest.
template <class F>
decltype(auto) BypassHooks(F&& body) {
  BypassScope scope;
  return std::forward<F>(body)();
}

namespace detail {
/// @brief Manual scope bracketing for callers that cannot use RAII (the C API).
void EnterBypass() noexcept;
/// @return false if the calling thread was not inside a bypass scope.
bool LeaveBypass() noexcept;
}  // namespace detail

}  // namespace dlchain
