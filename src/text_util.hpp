#pragma once

#include <cstddef>
#include <string>

namespace host_bridge {

// Shortens s to at most max_chars, ending in "...(truncated)" when cut.
std::string TruncateForLog(std::string s, size_t max_chars);

bool StartsWith(const std::string& s, const std::string& prefix);

}  // namespace host_bridge
