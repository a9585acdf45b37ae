#include "dispatcher.hpp"

#include "text_util.hpp"

#include <iostream>
#include <utility>

namespace host_bridge {
namespace {

static void Fail(BridgeError* err, ErrorCode code, std::string message) {
  if (!err) return;
  err->code = code;
  err->message = std::move(message);
  err->field.clear();
}

static void LogDispatch(const std::string& operation,
                        const std::string& provider,
                        bool ok,
                        const std::string& error,
                        const nlohmann::json& args) {
  std::cout << "[dispatch] op=" << operation << " provider=" << (provider.empty() ? "-" : provider)
            << " ok=" << (ok ? 1 : 0) << " error=" << (error.empty() ? "-" : error)
            << " args=" << TruncateForLog(args.dump(), 2000) << "\n";
}

}  // namespace

CommandDispatcher::CommandDispatcher(ProviderRegistry* registry, CommandWhitelist whitelist, bool enable_writes)
    : registry_(registry), whitelist_(std::move(whitelist)), enable_writes_(enable_writes) {}

std::optional<DispatchResult> CommandDispatcher::Dispatch(const std::string& operation,
                                                          const nlohmann::json& args,
                                                          BridgeError* err) {
  const auto* entry = whitelist_.Find(operation);
  if (!entry) {
    Fail(err, ErrorCode::kUnsupportedOperation, "operation not whitelisted: " + operation);
    LogDispatch(operation, "", false, "not whitelisted", nullptr);
    return std::nullopt;
  }
  if (entry->write && !enable_writes_) {
    Fail(err, ErrorCode::kUnsupportedOperation, "writes disabled: " + operation);
    LogDispatch(operation, "", false, "writes disabled", nullptr);
    return std::nullopt;
  }
  if (!args.is_null() && !args.is_object()) {
    if (err) *err = MakeValidationError("args", "args must be an object");
    return std::nullopt;
  }

  // Hold our own reference so the provider outlives a concurrent detach; no
  // registry lock is held past this line.
  auto provider = registry_ ? registry_->Active(entry->requires_program) : nullptr;
  if (!provider) {
    Fail(err, ErrorCode::kNoActiveContext,
         entry->requires_program ? "no program-capable context is active" : "no context is active");
    LogDispatch(operation, "", false, "no active context", args);
    return std::nullopt;
  }

  ScriptCall call;
  call.operation = operation;
  call.post = entry->post;
  call.args = args.is_null() ? nlohmann::json::object() : args;

  std::string call_err;
  auto lines = provider->Invoke(call, &call_err);
  if (!lines) {
    auto message = call_err.empty() ? "downstream call failed" : call_err;
    LogDispatch(operation, provider->Name(), false, message, call.args);
    Fail(err, ErrorCode::kDownstreamFailure, std::move(message));
    return std::nullopt;
  }
  if (!lines->empty() && StartsWith(lines->front(), "ERROR:")) {
    LogDispatch(operation, provider->Name(), false, lines->front(), call.args);
    Fail(err, ErrorCode::kDownstreamFailure, lines->front());
    return std::nullopt;
  }

  LogDispatch(operation, provider->Name(), true, "", call.args);
  DispatchResult out;
  out.provider = provider->Name();
  out.lines = std::move(*lines);
  return out;
}

}  // namespace host_bridge
