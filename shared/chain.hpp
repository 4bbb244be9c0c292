#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "hook-metadata.hpp"
#include "resolver.hpp"
#include "util.hpp"

namespace dlchain {

template <class Sig>
class Chain;

/// @brief Represents a hook that a user of this library registers on one symbol.
/// The hook is called with the (possibly already transformed) arguments of the call and a Chain, which it may use to
/// continue to the next hook (or the original), or ignore to short-circuit the call with its own result.
template <class Sig>
struct HookInfo;

template <class R, class... TArgs>
struct HookInfo<R(TArgs...)> {
  using ChainType = Chain<R(TArgs...)>;
  using FunctionType = std::function<R(TArgs..., ChainType&)>;

  FunctionType function;
  HookNameMetadata name_info{};
};

/// @brief An immutable, ordered snapshot of the hooks of one symbol. Index 0 is the outermost hook.
template <class Sig>
using HookList = std::vector<HookInfo<Sig>>;

/// @brief The per-dispatch cursor over a hook snapshot.
/// A Chain handed to hook N is positioned at N + 1: call() runs hook N + 1 with a cursor positioned at N + 2, and so on,
/// until the snapshot is exhausted and the original is called. Calling call() more than once from the same hook runs
/// the remainder of the chain again; it never moves backwards.
/// The snapshot is owned by the dispatching frame and outlives every Chain created for it.
template <class R, class... TArgs>
class Chain<R(TArgs...)> {
 public:
  using OriginalType = R (*)(TArgs...);

  Chain(HookList<R(TArgs...)> const* hooks, std::size_t index, OriginalSlot& original)
      : hooks_(hooks), index_(index), original_(&original) {
    DLCHAIN_ASSERT(hooks_ == nullptr || index_ <= hooks_->size());
  }

  /// @brief Continues the chain with the provided arguments.
  R call(TArgs... args) const {
    if (hooks_ != nullptr && index_ < hooks_->size()) {
      Chain next(hooks_, index_ + 1, *original_);
      return (*hooks_)[index_].function(std::forward<TArgs>(args)..., next);
    }
    return call_orig(std::forward<TArgs>(args)...);
  }

  /// @brief Skips the rest of the chain and calls the original directly.
  R call_orig(TArgs... args) const {
    return reinterpret_cast<OriginalType>(original_->get())(std::forward<TArgs>(args)...);
  }

  /// @brief The index of the hook call() would run next. Equal to size() when only the original remains.
  [[nodiscard]] std::size_t position() const {
    return index_;
  }

  /// @brief The number of hooks in the snapshot this chain walks.
  [[nodiscard]] std::size_t size() const {
    return hooks_ != nullptr ? hooks_->size() : 0;
  }

 private:
  HookList<R(TArgs...)> const* hooks_;
  std::size_t index_;
  OriginalSlot* original_;
};

}  // namespace dlchain
