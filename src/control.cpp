#include "control.hpp"

#include <atomic>
#include <cstdint>

#include "config.hpp"
#include "util.hpp"

namespace {

enum EnabledState : int {
  // Nothing has read or set the flag yet: DLCHAIN_DISABLED decides on first read
  kUnset = -1,
  kDisabled = 0,
  kEnabled = 1,
};

// Constant initialized, so the flag is valid before any static constructor of the process runs
constinit std::atomic<int> enabled{ kUnset };

constinit thread_local std::uint32_t bypass_depth = 0;

bool load_enabled() noexcept {
  int state = enabled.load(std::memory_order_acquire);
  if (state == kUnset) [[unlikely]] {
    int const initial = dlchain::Config::Get().start_disabled ? kDisabled : kEnabled;
    // Loses to an explicit EnableHooks / DisableHooks, whichever object's constructor made it
    if (enabled.compare_exchange_strong(state, initial, std::memory_order_acq_rel, std::memory_order_acquire)) {
      if (initial == kDisabled) {
        DLCHAIN_DEBUG("Hooks start disabled (DLCHAIN_DISABLED)");
      }
      return initial == kEnabled;
    }
  }
  return state == kEnabled;
}

}  // namespace

namespace dlchain {

void EnableHooks() noexcept {
  if (enabled.exchange(kEnabled, std::memory_order_acq_rel) != kEnabled) {
    DLCHAIN_DEBUG("Hooks enabled");
  }
}

void DisableHooks() noexcept {
  if (enabled.exchange(kDisabled, std::memory_order_acq_rel) != kDisabled) {
    DLCHAIN_DEBUG("Hooks disabled");
  }
}

bool HooksEnabled() noexcept {
  return load_enabled();
}

std::uint32_t BypassDepth() noexcept {
  return bypass_depth;
}

bool ShouldDispatch() noexcept {
  return bypass_depth == 0 && load_enabled();
}

BypassScope::BypassScope() noexcept {
  ++bypass_depth;
}

BypassScope::~BypassScope() {
  --bypass_depth;
}

namespace detail {

void EnterBypass() noexcept {
  ++bypass_depth;
}

bool LeaveBypass() noexcept {
  if (bypass_depth == 0) return false;
  --bypass_depth;
  return true;
}

}  // namespace detail

}  // namespace dlchain
