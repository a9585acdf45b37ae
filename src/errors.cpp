#include "errors.hpp"

namespace host_bridge {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kValidation:
      return "validation_error";
    case ErrorCode::kNoActiveContext:
      return "no_active_context";
    case ErrorCode::kUnsupportedOperation:
      return "unsupported_operation";
    case ErrorCode::kDownstreamFailure:
      return "downstream_failure";
    case ErrorCode::kSessionConflict:
      return "sse_already_active";
    case ErrorCode::kMethodNotAllowed:
      return "method_not_allowed";
  }
  return "unknown";
}

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kValidation:
      return 400;
    case ErrorCode::kNoActiveContext:
      return 503;
    case ErrorCode::kUnsupportedOperation:
      return 403;
    case ErrorCode::kDownstreamFailure:
      return 502;
    case ErrorCode::kSessionConflict:
      return 409;
    case ErrorCode::kMethodNotAllowed:
      return 405;
  }
  return 500;
}

BridgeError MakeValidationError(const std::string& field, const std::string& message) {
  BridgeError e;
  e.code = ErrorCode::kValidation;
  e.field = field;
  e.message = message;
  return e;
}

nlohmann::json MakeErrorJson(const BridgeError& e) {
  nlohmann::json j;
  j["ok"] = false;
  j["error"] = {{"code", ErrorCodeName(e.code)},
                {"message", e.message},
                {"field", e.field.empty() ? nlohmann::json(nullptr) : nlohmann::json(e.field)}};
  return j;
}

}  // namespace host_bridge
