#include "whitelist.hpp"

#include <algorithm>

namespace host_bridge {

CommandWhitelist::CommandWhitelist(const std::vector<WhitelistEntry>& entries) {
  for (const auto& e : entries) {
    if (e.name.empty()) continue;
    entries_[e.name] = e;
  }
}

const WhitelistEntry* CommandWhitelist::Find(const std::string& name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) return nullptr;
  return &it->second;
}

std::vector<std::string> CommandWhitelist::Names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [name, _] : entries_) out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

CommandWhitelist DefaultWhitelist() {
  std::vector<WhitelistEntry> entries;
  for (const char* name : {"read_dword",
                           "decompileByAddress",
                           "decompile_by_addr",
                           "disassemble",
                           "disassemble_function",
                           "disasmByAddr",
                           "function_by_addr",
                           "get_function_by_address",
                           "functionMeta",
                           "functions",
                           "list_functions",
                           "strings",
                           "list_strings",
                           "xrefs_to",
                           "get_xrefs_to",
                           "searchFunctions"}) {
    entries.push_back({name, false, true, false});
  }
  entries.push_back({"project_info", false, false, false});
  for (const char* name : {"rename_function_by_address", "set_decompiler_comment", "set_disassembly_comment"}) {
    entries.push_back({name, true, true, true});
  }
  return CommandWhitelist(entries);
}

}  // namespace host_bridge
