#include "core/errors.hpp"

namespace codeloop {

std::string to_string(ProviderErrorKind kind) {
  switch (kind) {
    case ProviderErrorKind::Auth:
      return "auth";
    case ProviderErrorKind::RateLimit:
      return "rate_limit";
    case ProviderErrorKind::Network:
      return "network";
    case ProviderErrorKind::InvalidResponse:
      return "invalid_response";
  }
  return "invalid_response";
}

std::string to_string(ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::UnknownTool:
      return "unknown_tool";
    case ToolErrorKind::SchemaInvalid:
      return "schema_invalid";
    case ToolErrorKind::SandboxDenied:
      return "sandbox_denied";
    case ToolErrorKind::ApprovalDenied:
      return "approval_denied";
    case ToolErrorKind::Timeout:
      return "timeout";
    case ToolErrorKind::HandlerFailure:
      return "handler_failure";
  }
  return "handler_failure";
}

}  // namespace codeloop
