#include "config.hpp"

#include "text_util.hpp"

#include <climits>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace host_bridge {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::optional<int> GetEnvInt(const char* key) {
  const char* v = std::getenv(key);
  if (!v || !*v) return std::nullopt;
  char* end = nullptr;
  long n = std::strtol(v, &end, 10);
  if (end == v) return std::nullopt;
  if (n > INT_MAX) n = INT_MAX;
  if (n < INT_MIN) n = INT_MIN;
  return static_cast<int>(n);
}

static std::string Trim(std::string v) {
  while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
  while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  return v;
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      cur = Trim(cur);
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  cur = Trim(cur);
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static UpstreamConfig DefaultUpstream() {
  UpstreamConfig up;
  up.name = "default";
  up.endpoint = ParseHttpEndpoint("http://127.0.0.1:8080/", 8080);
  up.program_context = true;
  up.program_manager = true;
  return up;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::optional<UpstreamConfig> ParseUpstreamSpec(const std::string& spec, std::string* err) {
  UpstreamConfig up;
  std::string rest = Trim(spec);

  auto eq_pos = rest.find('=');
  auto scheme_pos = rest.find("://");
  if (eq_pos != std::string::npos && (scheme_pos == std::string::npos || eq_pos < scheme_pos)) {
    up.name = Trim(rest.substr(0, eq_pos));
    rest = Trim(rest.substr(eq_pos + 1));
  }

  auto hash_pos = rest.find('#');
  std::string flags;
  if (hash_pos != std::string::npos) {
    flags = rest.substr(hash_pos + 1);
    rest = rest.substr(0, hash_pos);
  }
  if (rest.empty()) {
    if (err) *err = "upstream url is empty: " + spec;
    return std::nullopt;
  }

  std::string cur;
  flags.push_back('#');
  for (char c : flags) {
    if (c != '#') {
      cur.push_back(c);
      continue;
    }
    const auto flag = ToLower(Trim(cur));
    cur.clear();
    if (flag.empty()) continue;
    if (flag == "program") {
      up.program_context = true;
    } else if (flag == "manager") {
      up.program_manager = true;
    } else {
      if (err) *err = "unknown upstream flag '" + flag + "' in " + spec;
      return std::nullopt;
    }
  }

  up.endpoint = ParseHttpEndpoint(rest, 8080);
  return up;
}

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;

  if (auto host = GetEnvStr("HOST_BRIDGE_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvInt("HOST_BRIDGE_LISTEN_PORT")) cfg.listen.port = *port;

  if (auto writes = GetEnvStr("HOST_BRIDGE_ENABLE_WRITES"); !writes.empty()) {
    bool b = false;
    if (TryParseBool(writes, &b)) cfg.enable_writes = b;
  }
  if (auto v = GetEnvInt("HOST_BRIDGE_CONNECT_TIMEOUT_S"); v && *v > 0) cfg.connect_timeout_seconds = *v;
  if (auto v = GetEnvInt("HOST_BRIDGE_READ_TIMEOUT_S"); v && *v > 0) cfg.read_timeout_seconds = *v;
  if (auto v = GetEnvInt("HOST_BRIDGE_MAX_IN_FLIGHT"); v && *v > 0) cfg.max_in_flight = *v;
  if (auto v = GetEnvInt("HOST_BRIDGE_SSE_KEEPALIVE_S"); v && *v > 0) cfg.sse_keepalive_seconds = *v;

  auto upstreams = GetEnvStr("HOST_BRIDGE_UPSTREAMS");
  if (!upstreams.empty()) {
    for (const auto& spec : SplitCsv(upstreams)) {
      std::string err;
      auto up = ParseUpstreamSpec(spec, &err);
      if (!up) {
        std::cout << "[config] skip upstream error=" << err << "\n";
        continue;
      }
      if (up->name.empty()) up->name = "upstream" + std::to_string(cfg.upstreams.size() + 1);
      cfg.upstreams.push_back(std::move(*up));
    }
  }
  if (cfg.upstreams.empty()) cfg.upstreams.push_back(DefaultUpstream());

  return cfg;
}

}  // namespace host_bridge
