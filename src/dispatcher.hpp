#pragma once

#include "errors.hpp"
#include "providers/registry.hpp"
#include "whitelist.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace host_bridge {

struct DispatchResult {
  std::string provider;
  std::vector<std::string> lines;
};

// Forwards whitelisted operations to the active provider. Anything not on
// the list is rejected before a provider is even looked up.
class CommandDispatcher {
 public:
  CommandDispatcher(ProviderRegistry* registry, CommandWhitelist whitelist, bool enable_writes);

  std::optional<DispatchResult> Dispatch(const std::string& operation, const nlohmann::json& args, BridgeError* err);

  const CommandWhitelist& Whitelist() const { return whitelist_; }
  bool WritesEnabled() const { return enable_writes_; }

 private:
  ProviderRegistry* registry_;
  CommandWhitelist whitelist_;
  bool enable_writes_;
};

}  // namespace host_bridge
