#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

#include "chain.hpp"
#include "control.hpp"
#include "hook-metadata.hpp"
#include "registration-result.hpp"
#include "resolver.hpp"
#include "type-info.hpp"
#include "util.hpp"

namespace dlchain {

/// @brief The signature independent part of a registry: identity, signature descriptor, original cache and
/// introspection. This is what the process-wide Directory stores.
class RegistryBase {
 public:
  RegistryBase(char const* symbol, SignatureInfo signature, LookupFunction lookup)
      : signature_(std::move(signature)), original_(symbol, lookup) {}
  virtual ~RegistryBase() = default;

  RegistryBase(RegistryBase const&) = delete;
  RegistryBase& operator=(RegistryBase const&) = delete;

  [[nodiscard]] std::string_view name() const {
    return original_.symbol();
  }

  [[nodiscard]] SignatureInfo const& signature() const {
    return signature_;
  }

  /// @brief Returns the original implementation, resolving it on first use.
  [[nodiscard]] void* original_pointer() {
    return original_.get();
  }

  [[nodiscard]] OriginalSlot& original() {
    return original_;
  }

  /// @brief Number of hooks a dispatch starting now would see.
  [[nodiscard]] virtual std::size_t hook_count() const = 0;

  /// @brief Name metadata of the current hooks, outermost first.
  [[nodiscard]] virtual std::vector<HookNameMetadata> hook_names() const = 0;

  /// @brief Number of current hooks whose name metadata matches filter (by name or by namespace).
  [[nodiscard]] std::size_t count_matching(HookNameMetadata const& filter) const {
    std::size_t count = 0;
    for (auto const& hook_name : hook_names()) {
      if (filter.matches(hook_name)) ++count;
    }
    return count;
  }

 protected:
  SignatureInfo signature_;
  OriginalSlot original_;
};

template <class Sig>
class Registry;

/// @brief The hook registry of one intercepted symbol with signature R(TArgs...).
/// Hooks are kept in registration order (first registered is outermost) and are never reordered or removed.
/// Writers serialize on a mutex and publish a new immutable HookList; dispatches take a reference to whichever list is
/// current when they begin and walk it without holding any lock, so a hook added mid-dispatch is only seen by later
/// dispatches.
template <class R, class... TArgs>
class Registry<R(TArgs...)> final : public RegistryBase {
 public:
  using SignatureType = R(TArgs...);
  using HookType = HookInfo<SignatureType>;
  using ChainType = Chain<SignatureType>;
  using FunctionType = typename HookType::FunctionType;
  using OriginalType = typename ChainType::OriginalType;
  using SnapshotType = std::shared_ptr<HookList<SignatureType> const>;

  explicit Registry(char const* symbol, LookupFunction lookup = &LookupNext)
      : RegistryBase(symbol, SignatureInfo::from<R, TArgs...>(), lookup) {}

  /// @brief Appends a hook to the end of the chain (it becomes the innermost hook, closest to the original).
  [[nodiscard]] registration::Result add_hook(HookType&& hook) {
    if (!hook.function) {
      return registration::Result::ErrAt<registration::NullHook>(name(), hook.name_info);
    }
    std::size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      auto current = hooks_.load(std::memory_order_acquire);
      auto next = std::make_shared<HookList<SignatureType>>();
      if (current != nullptr) {
        next->reserve(current->size() + 1);
        next->insert(next->end(), current->begin(), current->end());
      }
      index = next->size();
      next->emplace_back(std::move(hook));
      hooks_.store(SnapshotType(std::move(next)), std::memory_order_release);
    }
    DLCHAIN_DEBUG("Added hook #{} for symbol: {}", index, name());
    return registration::Result::Ok(registration::Ok{ .index = index });
  }

  [[nodiscard]] registration::Result add_hook(FunctionType function, HookNameMetadata name_info = {}) {
    return add_hook(HookType{ .function = std::move(function), .name_info = std::move(name_info) });
  }

  /// @brief Calls the original implementation, ignoring every hook and the control state.
  R call_orig(TArgs... args) {
    return reinterpret_cast<OriginalType>(original_.get())(std::forward<TArgs>(args)...);
  }

  /// @brief The body of the interception entry point.
  /// If hooks are disabled, or the calling thread is bypassing, or there are no hooks, calls the original directly.
  /// Otherwise runs the first hook of the current snapshot. Exceptions thrown by hooks propagate to the caller.
  R dispatch(TArgs... args) {
    if (!ShouldDispatch()) {
      return call_orig(std::forward<TArgs>(args)...);
    }
    auto const snapshot = hooks_.load(std::memory_order_acquire);
    if (snapshot == nullptr || snapshot->empty()) {
      return call_orig(std::forward<TArgs>(args)...);
    }
    ChainType chain(snapshot.get(), 0, original_);
    return chain.call(std::forward<TArgs>(args)...);
  }

  /// @brief The hook list a dispatch starting now would walk. Never null.
  [[nodiscard]] SnapshotType snapshot() const {
    auto current = hooks_.load(std::memory_order_acquire);
    if (current == nullptr) {
      return std::make_shared<HookList<SignatureType> const>();
    }
    return current;
  }

  [[nodiscard]] std::size_t hook_count() const override {
    auto current = hooks_.load(std::memory_order_acquire);
    return current != nullptr ? current->size() : 0;
  }

  [[nodiscard]] std::vector<HookNameMetadata> hook_names() const override {
    std::vector<HookNameMetadata> names;
    auto current = hooks_.load(std::memory_order_acquire);
    if (current == nullptr) return names;
    names.reserve(current->size());
    for (auto const& hook : *current) {
      names.push_back(hook.name_info);
    }
    return names;
  }

 private:
  std::mutex write_mutex_;
  std::atomic<SnapshotType> hooks_{};
};

}  // namespace dlchain
