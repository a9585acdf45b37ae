#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace host_bridge {

struct WhitelistEntry {
  std::string name;
  bool post = false;
  bool requires_program = true;
  bool write = false;
};

// Fixed allow-list of host operations. Immutable after construction.
class CommandWhitelist {
 public:
  explicit CommandWhitelist(const std::vector<WhitelistEntry>& entries);

  const WhitelistEntry* Find(const std::string& name) const;
  bool IsAllowed(const std::string& name) const { return Find(name) != nullptr; }
  std::vector<std::string> Names() const;

 private:
  std::unordered_map<std::string, WhitelistEntry> entries_;
};

CommandWhitelist DefaultWhitelist();

}  // namespace host_bridge
