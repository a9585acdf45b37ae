#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace host_bridge {

enum class ErrorCode {
  kValidation,
  kNoActiveContext,
  kUnsupportedOperation,
  kDownstreamFailure,
  kSessionConflict,
  kMethodNotAllowed,
};

struct BridgeError {
  ErrorCode code = ErrorCode::kDownstreamFailure;
  std::string message;
  // Offending request field, set for validation errors only.
  std::string field;
};

const char* ErrorCodeName(ErrorCode code);
int HttpStatusFor(ErrorCode code);

BridgeError MakeValidationError(const std::string& field, const std::string& message);

// {"ok": false, "error": {"code", "message", "field"}}
nlohmann::json MakeErrorJson(const BridgeError& e);

}  // namespace host_bridge
