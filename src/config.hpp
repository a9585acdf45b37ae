#pragma once

#include <optional>
#include <string>
#include <vector>

namespace host_bridge {

struct HttpListenConfig {
  std::string host = "127.0.0.1";
  int port = 8081;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 8080;
  std::string base_path;
};

// One host view reachable over its embedded plugin surface.
struct UpstreamConfig {
  std::string name;
  HttpEndpoint endpoint;
  bool program_context = false;
  bool program_manager = false;
};

struct BridgeConfig {
  HttpListenConfig listen;
  std::vector<UpstreamConfig> upstreams;
  bool enable_writes = false;
  int connect_timeout_seconds = 5;
  int read_timeout_seconds = 30;
  int max_in_flight = 4;
  int sse_keepalive_seconds = 15;
};

BridgeConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

// Parses "name=url#program#manager". The name and both flags are optional.
std::optional<UpstreamConfig> ParseUpstreamSpec(const std::string& spec, std::string* err);

}  // namespace host_bridge
