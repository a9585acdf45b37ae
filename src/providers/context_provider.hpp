#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace host_bridge {

struct ScriptCall {
  std::string operation;
  bool post = false;
  nlohmann::json args = nlohmann::json::object();
};

// One attached host view. The registry only looks at the two capability
// queries; the dispatcher additionally calls Invoke on the active provider.
class IContextProvider {
 public:
  virtual ~IContextProvider() = default;

  virtual std::string Name() const = 0;
  virtual bool HasProgramContext() const = 0;
  virtual bool HasProgramManagerService() const = 0;

  // Returns the host's response split into lines.
  virtual std::optional<std::vector<std::string>> Invoke(const ScriptCall& call, std::string* err) = 0;
};

}  // namespace host_bridge
