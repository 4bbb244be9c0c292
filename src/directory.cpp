#include "directory.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "util.hpp"

namespace dlchain {

Directory& Directory::Get() {
  // Leaked on purpose: entry points may still be called during static destruction
  static auto& directory = *new Directory();
  return directory;
}

void Directory::add(RegistryBase& registry) {
  DLCHAIN_ASSERT(!registry.name().empty());
  std::lock_guard<std::mutex> lock(mutex_);
  auto const [it, inserted] = registries_.emplace(registry.name(), &registry);
  if (!inserted) {
    DLCHAIN_ABORT("Symbol: {} is intercepted twice in the same process (existing registry: {}, new registry: {})",
                  registry.name(), fmt::ptr(it->second), fmt::ptr(&registry));
  }
  DLCHAIN_DEBUG("Registered interception registry for symbol: {} with {} parameters", registry.name(),
                registry.signature().parameter_info.size());
}

RegistryBase* Directory::find(std::string_view symbol) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto const it = registries_.find(symbol);
  return it != registries_.end() ? it->second : nullptr;
}

std::vector<std::string> Directory::symbols() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(registries_.size());
  for (auto const& [name, _] : registries_) {
    names.emplace_back(name);
  }
  return names;
}

Result<std::monostate, registration::SignatureMismatch> ValidateSignature(std::string_view symbol,
                                                                         SignatureInfo const& existing,
                                                                         SignatureInfo const& incoming) {
  using ResultT = Result<std::monostate, registration::SignatureMismatch>;
  // 1. Return type
  if (existing.return_info != incoming.return_info) {
    return ResultT::ErrAt<registration::MismatchReturn>(symbol, existing.return_info, incoming.return_info);
  }
  // 2. Parameter count
  if (existing.parameter_info.size() != incoming.parameter_info.size()) {
    return ResultT::ErrAt<registration::MismatchParamCount>(symbol, existing.parameter_info.size(),
                                                            incoming.parameter_info.size());
  }
  // 3. Each parameter, in order
  for (size_t i = 0; i < existing.parameter_info.size(); i++) {
    if (existing.parameter_info[i] != incoming.parameter_info[i]) {
      return ResultT::ErrAt<registration::MismatchParam>(symbol, i, existing.parameter_info[i],
                                                         incoming.parameter_info[i]);
    }
  }
  return ResultT::Ok();
}

}  // namespace dlchain
