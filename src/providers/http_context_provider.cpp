#include "providers/http_context_provider.hpp"

#include <httplib.h>

#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace host_bridge {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   int connect_timeout_seconds,
                                                   int read_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::string ArgToString(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
  return v.dump();
}

static httplib::Params ToParams(const nlohmann::json& args) {
  httplib::Params params;
  if (!args.is_object()) return params;
  for (auto it = args.begin(); it != args.end(); ++it) {
    if (it.value().is_null()) continue;
    params.emplace(it.key(), ArgToString(it.value()));
  }
  return params;
}

static std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back(line);
  }
  return out;
}

}  // namespace

HttpContextProvider::HttpContextProvider(UpstreamConfig upstream)
    : upstream_(std::move(upstream)), program_context_(upstream_.program_context) {}

std::string HttpContextProvider::Name() const {
  return upstream_.name;
}

bool HttpContextProvider::HasProgramContext() const {
  return program_context_.load();
}

bool HttpContextProvider::HasProgramManagerService() const {
  return upstream_.program_manager;
}

void HttpContextProvider::SetProgramContext(bool has_program) {
  program_context_.store(has_program);
}

void HttpContextProvider::SetTimeouts(int connect_seconds, int read_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (read_seconds > 0) read_timeout_seconds_ = read_seconds;
}

void HttpContextProvider::SetMaxInFlight(int max_in_flight) {
  if (max_in_flight > 0) max_in_flight_ = max_in_flight;
}

std::optional<std::vector<std::string>> HttpContextProvider::Invoke(const ScriptCall& call, std::string* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_flight_ >= max_in_flight_) {
      if (err) *err = upstream_.name + ": too many in-flight requests";
      return std::nullopt;
    }
    in_flight_++;
  }

  auto dec = [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_--;
  };

  auto cli = MakeClient(upstream_.endpoint, connect_timeout_seconds_, read_timeout_seconds_);
  const auto path = JoinPath(upstream_.endpoint.base_path, "/" + call.operation);
  const auto params = ToParams(call.args);

  httplib::Result res = call.post ? cli->Post(path, params) : cli->Get(path, params, httplib::Headers());
  if (!res) {
    if (err) *err = upstream_.name + ": " + httplib::to_string(res.error());
    dec();
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = upstream_.name + ": /" + call.operation + " http " + std::to_string(res->status);
    dec();
    return std::nullopt;
  }
  dec();
  return SplitLines(res->body);
}

}  // namespace host_bridge
