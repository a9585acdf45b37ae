#include "bridge_router.hpp"

#include "search.hpp"
#include "text_util.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace host_bridge {
namespace {

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static void SendError(httplib::Response* res, const BridgeError& err) {
  SendJson(res, HttpStatusFor(err.code), MakeErrorJson(err));
}

static void SendMethodNotAllowed(httplib::Response* res) {
  res->set_header("Allow", "GET");
  SendJson(res, 405, {{"error", "method_not_allowed"}, {"allow", "GET"}});
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static void LogRequest(const httplib::Request& req) {
  std::cout << "[request] " << req.method << " " << req.path << " remote=" << req.remote_addr;
  if (!req.body.empty()) std::cout << " body=" << TruncateForLog(req.body, 2000);
  std::cout << "\n";
}

static nlohmann::json NameOrNull(const std::shared_ptr<IContextProvider>& p) {
  return p ? nlohmann::json(p->Name()) : nlohmann::json(nullptr);
}

}  // namespace

BridgeRouter::BridgeRouter(const BridgeConfig& cfg,
                           ProviderRegistry* registry,
                           CommandDispatcher* dispatcher,
                           EventStream* events,
                           SharedHttpServerState* servers)
    : cfg_(cfg), registry_(registry), dispatcher_(dispatcher), events_(events), servers_(servers) {}

void BridgeRouter::Register(httplib::Server* server) {
  auto search_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto body = ParseJsonBody(req);
    if (body.is_discarded()) return SendError(&res, MakeValidationError("body", "request body is not valid JSON"));

    BridgeError err;
    auto sreq = ParseSearchRequest(body, &err);
    if (!sreq) return SendError(&res, err);

    SearchFetcher fetch = [this](const std::string& query, BridgeError* ferr) -> std::optional<std::vector<std::string>> {
      auto r = dispatcher_->Dispatch("searchFunctions", {{"query", query}}, ferr);
      if (!r) return std::nullopt;
      return std::move(r->lines);
    };
    auto page = SearchFunctions(*sreq, fetch, &err);
    if (!page) return SendError(&res, err);
    SendJson(&res, 200, *page);
  };

  auto invoke_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) {
      return SendError(&res, MakeValidationError("body", "request body must be a JSON object"));
    }
    if (!body.contains("operation") || !body["operation"].is_string() ||
        body["operation"].get<std::string>().empty()) {
      return SendError(&res, MakeValidationError("operation", "operation must be a non-empty string"));
    }
    const auto operation = body["operation"].get<std::string>();
    nlohmann::json args = body.contains("args") ? body["args"] : nlohmann::json::object();

    BridgeError err;
    auto r = dispatcher_->Dispatch(operation, args, &err);
    if (!r) return SendError(&res, err);
    nlohmann::json out;
    out["ok"] = true;
    out["operation"] = operation;
    out["provider"] = r->provider;
    out["lines"] = r->lines;
    SendJson(&res, 200, out);
  };

  auto health_handler = [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["service"] = "host-bridge";
    j["unix_seconds"] = NowSeconds();
    j["writes_enabled"] = dispatcher_ ? dispatcher_->WritesEnabled() : false;

    auto listener = servers_ ? servers_->Current() : nullptr;
    j["listener"] = {{"port", listener ? nlohmann::json(listener->Port()) : nlohmann::json(nullptr)},
                     {"running", listener ? listener->IsRunning() : false},
                     {"interest", servers_ ? servers_->Interest() : 0}};

    auto active = registry_ ? registry_->Active(false) : nullptr;
    auto active_program = registry_ ? registry_->Active(true) : nullptr;
    j["context"] = {{"providers", registry_ ? registry_->Size() : 0},
                    {"available", active != nullptr},
                    {"active", NameOrNull(active)},
                    {"active_program", NameOrNull(active_program)}};

    if (events_) {
      const auto state = events_->Guard().State();
      j["stream"] = {{"state", StreamStateName(state)},
                     {"active", state != StreamState::kIdle},
                     {"connects", events_->Guard().Connects()}};
    }
    SendJson(&res, 200, j);
  };

  auto events_get = [this](const httplib::Request& req, httplib::Response& res) {
    // HEAD requests are routed here too.
    auto admitted = events_->Open(req.method);
    if (admitted.status == StreamAdmission::kMethodNotAllowed) return SendMethodNotAllowed(&res);
    if (admitted.status == StreamAdmission::kConflict) {
      std::cout << "[sse] reject remote=" << req.remote_addr << " active_id=" << admitted.connection_id
                << " status=409\n";
      return SendJson(&res, 409, {{"error", "sse_already_active"}, {"detail", "Another client is connected."}});
    }

    res.status = 200;
    res.set_header("Cache-Control", "no-store");
    res.set_header("X-Accel-Buffering", "no");
    auto* events = events_;
    const auto id = admitted.connection_id;
    res.set_chunked_content_provider(
        "text/event-stream",
        [events, id](size_t, httplib::DataSink& sink) {
          std::string chunk;
          if (!events->NextChunk(id, &chunk)) {
            sink.done();
            return true;
          }
          if (sink.is_writable && !sink.is_writable()) return false;
          if (!sink.write) return false;
          return sink.write(chunk.data(), chunk.size());
        },
        [events, id](bool) { events->EndSession(id); });
  };

  auto events_reject = [](const httplib::Request& req, httplib::Response& res) {
    std::cout << "[sse] method_not_allowed method=" << req.method << " remote=" << req.remote_addr << "\n";
    SendMethodNotAllowed(&res);
  };

  server->Post("/search", search_handler);
  server->Post("/api/search_functions.json", search_handler);
  server->Post("/api/invoke", invoke_handler);
  server->Get("/health", health_handler);
  server->Get("/api/health.json", health_handler);
  if (events_) {
    server->Get("/events", events_get);
    server->Post("/events", events_reject);
    server->Put("/events", events_reject);
    server->Patch("/events", events_reject);
    server->Delete("/events", events_reject);
    server->Options("/events", events_reject);
  }

  server->set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] handler exception message=" << message << "\n";
    nlohmann::json j;
    j["ok"] = false;
    j["error"] = {{"code", "internal"}, {"message", message}, {"field", nullptr}};
    SendJson(&res, 500, j);
  });

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["ok"] = false;
    j["error"] = {{"code", "http_" + std::to_string(res.status)}, {"message", message}, {"field", nullptr}};
    res.set_content(j.dump(), "application/json");
  });

  server->set_keep_alive_timeout(5);
  server->set_read_timeout(60);
  server->set_write_timeout(60);
}

ListenerFactory BridgeRouter::MakeListenerFactory() {
  return [this](int port, std::string* err) -> std::shared_ptr<EmbeddedListener> {
    auto listener = std::make_shared<EmbeddedListener>();
    Register(listener->Server());
    auto* events = events_;
    listener->AddShutdownHook([events]() {
      if (events) events->Close();
    });
    if (!listener->Start(cfg_.listen.host, port, err)) return nullptr;
    return listener;
  };
}

}  // namespace host_bridge
